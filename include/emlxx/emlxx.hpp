#pragma once

#include <emlxx/config.hpp>
#include <emlxx/export.hpp>

#include <emlxx/codec/base64.hpp>
#include <emlxx/codec/charset.hpp>
#include <emlxx/codec/codec.hpp>
#include <emlxx/codec/q_codec.hpp>
#include <emlxx/codec/quoted_printable.hpp>
#include <emlxx/codec/uuencode.hpp>

#include <emlxx/mime/header.hpp>
#include <emlxx/mime/message.hpp>
#include <emlxx/mime/mime.hpp>

// Utilities
#include <emlxx/detail/log.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/detail/sanitize.hpp>

// Extraction
#include <emlxx/storage/attachment_store.hpp>
#include <emlxx/extract/options.hpp>
#include <emlxx/extract/extractor.hpp>
