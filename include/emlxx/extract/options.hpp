/*

extract/options.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <emlxx/detail/sanitize.hpp>

namespace emlxx::extract
{

/**
 * Configuration of the attachment extraction.
 */
struct extract_options
{
    /// Put the attachments of a message in a folder named after its subject
    bool create_subject_subfolder = true;

    /// Put each attachment in a folder named after its lower cased extension
    bool classify_by_extension = false;

    /// Longest subject or filename kept, in code points
    std::size_t max_name_length = detail::MAX_NAME_LENGTH;

    /// Name used when sanitizing leaves nothing
    std::string placeholder_name{detail::PLACEHOLDER_NAME};

    /// Folder of the attachments without an extension
    std::string no_extension_label{detail::NO_EXTENSION_LABEL};

    /// Output folder created next to the first input when none is given
    std::string default_output_folder = "extracted_attachments";

    /// Extensions picked up when scanning directories (case insensitive)
    std::vector<std::string> input_extensions{".eml"};

    /// Deepest accepted multipart nesting
    std::size_t max_nesting_depth = 64;

    // ==================== Factory Methods ====================

    /// One folder per message subject
    static extract_options by_subject()
    {
        return extract_options{};
    }

    /// One folder per message subject, then one per extension
    static extract_options by_type()
    {
        extract_options cfg;
        cfg.classify_by_extension = true;
        return cfg;
    }

    /// Everything directly in the output folder
    static extract_options flat()
    {
        extract_options cfg;
        cfg.create_subject_subfolder = false;
        return cfg;
    }
};

} // namespace emlxx::extract
