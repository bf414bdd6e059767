/*

extract/extractor.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <emlxx/detail/ascii.hpp>
#include <emlxx/detail/error_detail.hpp>
#include <emlxx/detail/exception_bridge.hpp>
#include <emlxx/detail/log.hpp>
#include <emlxx/detail/result.hpp>
#include <emlxx/detail/sanitize.hpp>
#include <emlxx/extract/options.hpp>
#include <emlxx/mime/message.hpp>
#include <emlxx/storage/attachment_store.hpp>

namespace emlxx::extract
{

/**
 * One message file to extract and where to put its attachments.
 */
struct extraction_request
{
    std::filesystem::path source_path;
    std::filesystem::path output_root;
    bool create_subject_subfolder = true;
    bool classify_by_extension = false;
};

/**
 * Outcome of one message file.
 *
 * On error `written_paths` is empty; files written before the failure stay on disk.
 */
struct extraction_result
{
    std::vector<std::filesystem::path> written_paths;
    std::optional<emlxx::error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

struct batch_summary
{
    std::size_t processed = 0;    ///< Requests handled before the end or the cancellation
    std::size_t succeeded = 0;    ///< Handled without error, including those without attachments
    std::size_t failed = 0;       ///< Handled with an error
    std::size_t attachments = 0;  ///< Files written over the whole batch
    bool cancelled = false;       ///< Stopped before the last request
};

struct batch_entry
{
    extraction_request request;
    extraction_result result;
};

struct batch_result
{
    std::vector<batch_entry> entries;
    batch_summary summary;
};

/// Called after each request with its zero based index
using progress_callback = std::function<void(std::size_t index, std::size_t total, const extraction_request&, const extraction_result&)>;


/**
Sequential attachment extraction from message files.

An extractor holds no state besides its options; it may be used from any thread, one batch at a time per output root.
**/
class extractor
{
public:
    extractor() = default;

    explicit extractor(extract_options options)
        : options_(std::move(options))
    {
    }

    const extract_options& options() const
    {
        return options_;
    }

    /**
    Request for a source file using the layout switches of the options.
    **/
    extraction_request make_request(std::filesystem::path source, std::filesystem::path output_root) const
    {
        extraction_request req;
        req.source_path = std::move(source);
        req.output_root = std::move(output_root);
        req.create_subject_subfolder = options_.create_subject_subfolder;
        req.classify_by_extension = options_.classify_by_extension;
        return req;
    }

    /**
    Extracting the attachments of one message file.

    Reading, parsing and writing errors end up in the result, nothing is thrown.
    **/
    extraction_result extract_one(const extraction_request& request) const
    {
        EMLXX_INFO("Processing " + detail::path_utf8(request.source_path));

        auto outcome = protect([&]() { return extract_message(request); }, error_code::internal_error);
        extraction_result res;
        if (outcome && *outcome)
        {
            res.written_paths = std::move(**outcome);
            if (res.written_paths.empty())
                EMLXX_INFO("No attachments in " + detail::path_utf8(request.source_path));
            return res;
        }

        res.error = outcome ? std::move(outcome->error()) : std::move(outcome.error());
        EMLXX_ERROR(detail::path_utf8(request.source_path) + ": " + res.error->to_string());
        if (!res.error->detail().empty())
            EMLXX_DEBUG(res.error->detail());
        return res;
    }

    /**
    Extracting the requests one after the other in the given order.

    @param requests Requests to handle.
    @param progress Called after each handled request.
    @param stop     Checked before each request; once set, the remaining requests are not handled.
    @return         One entry per handled request and the summary.
    **/
    batch_result extract_batch(const std::vector<extraction_request>& requests, const progress_callback& progress = {},
        const std::atomic<bool>* stop = nullptr) const
    {
        batch_result batch;
        batch.entries.reserve(requests.size());
        EMLXX_INFO("Extracting attachments from " + std::to_string(requests.size()) + " file(s)");

        for (std::size_t i = 0; i < requests.size(); ++i)
        {
            if (stop != nullptr && stop->load(std::memory_order_relaxed))
            {
                batch.summary.cancelled = true;
                EMLXX_WARN("Cancelled after " + std::to_string(i) + " of " + std::to_string(requests.size()) + " file(s)");
                break;
            }

            auto res = extract_one(requests[i]);
            ++batch.summary.processed;
            if (res.ok())
                ++batch.summary.succeeded;
            else
                ++batch.summary.failed;
            batch.summary.attachments += res.written_paths.size();

            batch.entries.push_back({requests[i], std::move(res)});
            if (progress)
                notify(progress, i, requests.size(), batch.entries.back());
        }

        EMLXX_INFO("Done: " + std::to_string(batch.summary.succeeded) + " succeeded, " + std::to_string(batch.summary.failed) +
            " failed, " + std::to_string(batch.summary.attachments) + " attachment(s) extracted");
        return batch;
    }

    /**
    Folder next to the first input, named after `default_output_folder`.
    **/
    result<std::filesystem::path> default_output_root(const std::vector<std::filesystem::path>& inputs) const
    {
        if (inputs.empty())
            return fail<std::filesystem::path>(error_code::invalid_argument, "No input file to derive the output folder from");
        return inputs.front().parent_path() / detail::utf8_path(options_.default_output_folder);
    }

    /**
    Expanding files and directories into the list of message files.

    Files are kept whatever their extension. Directories are walked recursively for files with one of the `input_extensions`, sorted
    by path. Duplicates are dropped, the first occurrence wins. Paths that do not exist are kept so that they get reported.
    **/
    result<std::vector<std::filesystem::path>> collect_inputs(const std::vector<std::filesystem::path>& paths) const
    {
        std::vector<std::filesystem::path> found;
        std::set<std::filesystem::path> seen;
        auto add = [&](const std::filesystem::path& p)
        {
            std::error_code ec;
            auto key = std::filesystem::weakly_canonical(p, ec);
            if (ec)
                key = p.lexically_normal();
            if (seen.insert(key).second)
                found.push_back(p);
        };

        for (const auto& p : paths)
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(p, ec))
            {
                add(p);
                continue;
            }

            std::vector<std::filesystem::path> files;
            std::filesystem::recursive_directory_iterator it(p, std::filesystem::directory_options::skip_permission_denied, ec);
            for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
            {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec) && has_input_extension(it->path()))
                    files.push_back(it->path());
            }
            if (ec)
                return fail<std::vector<std::filesystem::path>>(error_code::file_system_error,
                    "Cannot scan directory: " + detail::path_utf8(p),
                    detail::error_detail().add_path("path", p).add("op", "scan").add_ec("errc", ec).str());

            std::sort(files.begin(), files.end());
            for (const auto& f : files)
                add(f);
        }
        EMLXX_DEBUG("Collected " + std::to_string(found.size()) + " input file(s)");
        return found;
    }

private:

    result<std::vector<std::filesystem::path>> extract_message(const extraction_request& request) const
    {
        using paths_t = std::vector<std::filesystem::path>;

        mime_options mopts;
        mopts.max_nesting_depth = options_.max_nesting_depth;
        auto msg = load_message(request.source_path, mopts);
        if (!msg)
            return fail<paths_t>(std::move(msg.error()));

        std::string subject = msg->subject();
        if (subject.empty())
            subject = detail::path_utf8(request.source_path.stem());
        subject = sanitize(subject);

        std::filesystem::path base_dir;
        if (request.create_subject_subfolder)
            base_dir = detail::utf8_path(subject);
        storage::attachment_store store(request.output_root);
        auto created = storage::attachment_store::ensure_directory(base_dir.empty() ? store.root() : store.root() / base_dir);
        if (!created)
            return fail<paths_t>(std::move(created.error()));

        auto parts = msg->attachments();
        log_skipped(*msg, parts.size());

        paths_t written;
        for (const mime* part : parts)
        {
            std::string name = sanitize(part->filename());
            auto target_dir = base_dir;
            if (request.classify_by_extension)
                target_dir /= detail::utf8_path(detail::extension_label(name, options_.no_extension_label));

            auto stored = store.store(target_dir, name, *part->payload());
            if (!stored)
                return fail<paths_t>(std::move(stored.error()));
            EMLXX_INFO("Extracted " + detail::path_utf8(*stored));
            written.push_back(std::move(*stored));
        }
        return written;
    }

    std::string sanitize(std::string_view name) const
    {
        return detail::sanitize_file_name(name, options_.max_name_length, options_.placeholder_name);
    }

    bool has_input_extension(const std::filesystem::path& p) const
    {
        auto ext = detail::path_utf8(p.extension());
        return std::any_of(options_.input_extensions.begin(), options_.input_extensions.end(),
            [&ext](const std::string& wanted) { return detail::iequals_ascii(ext, wanted); });
    }

    static void log_skipped(const message& msg, std::size_t kept)
    {
        if (!log::logger::instance().is_enabled(log::level::debug))
            return;
        std::size_t marked = 0;
        msg.walk([&marked](const mime& part)
        {
            auto disposition = part.content_disposition();
            if (disposition && *disposition == "attachment")
                ++marked;
        });
        if (marked > kept)
            EMLXX_DEBUG("Skipped " + std::to_string(marked - kept) + " attachment part(s) without a filename or content");
    }

    static void notify(const progress_callback& progress, std::size_t index, std::size_t total, const batch_entry& entry)
    {
        try
        {
            progress(index, total, entry.request, entry.result);
        }
        catch (const std::exception& exc)
        {
            EMLXX_WARN(std::string("Progress callback failed: ") + exc.what());
        }
    }

    extract_options options_;
};

} // namespace emlxx::extract
