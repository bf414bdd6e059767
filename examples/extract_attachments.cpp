/*

extract_attachments.cpp
-----------------------

Extracts the attachments of message files into folders named after their subjects.

    emlxx_extract [-o DIR] [--no-subject-folder] [--by-type] [-v|-q] PATH...

Directories are scanned recursively for `.eml` files. Without `-o` the attachments go to `extracted_attachments` next to the first input.
Exit code is 0 when every file succeeded, 1 when some failed and 2 on usage errors.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <emlxx/emlxx.hpp>
#include "example_util.hpp"


using std::cout;
using std::cerr;
using std::string_view;
using emlxx::extract::extract_options;
using emlxx::extract::extraction_request;
using emlxx::extract::extraction_result;
using emlxx::extract::extractor;


namespace
{

constexpr int EXIT_USAGE = 2;

void usage(const char* prog)
{
    cerr << "Usage: " << prog << " [-o DIR] [--no-subject-folder] [--by-type] [-v|-q] PATH...\n"
         << "  -o, --output DIR       output folder (default: extracted_attachments next to the first input)\n"
         << "  --no-subject-folder    do not create one folder per message subject\n"
         << "  --by-type              one folder per attachment extension\n"
         << "  -v, --verbose          debug logging\n"
         << "  -q, --quiet            errors only\n";
}

} // namespace


int main(int argc, char* argv[])
{
    extract_options opts = extract_options::by_subject();
    std::filesystem::path output;
    std::vector<std::filesystem::path> paths;
    auto& log = emlxx::log::logger::instance();

    for (int i = 1; i < argc; ++i)
    {
        string_view arg = argv[i];
        if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= argc)
            {
                usage(argv[0]);
                return EXIT_USAGE;
            }
            output = argv[++i];
        }
        else if (arg == "--no-subject-folder")
            opts.create_subject_subfolder = false;
        else if (arg == "--by-type")
            opts.classify_by_extension = true;
        else if (arg == "-v" || arg == "--verbose")
            log.set_level(emlxx::log::level::debug);
        else if (arg == "-q" || arg == "--quiet")
            log.set_level(emlxx::log::level::error);
        else if (arg == "-h" || arg == "--help")
        {
            usage(argv[0]);
            return EXIT_SUCCESS;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            cerr << "Unknown option: " << arg << "\n";
            usage(argv[0]);
            return EXIT_USAGE;
        }
        else
            paths.emplace_back(argv[i]);
    }

    extractor ex(opts);
    auto inputs = ex.collect_inputs(paths);
    if (!inputs)
    {
        print_error(inputs.error());
        return EXIT_FAILURE;
    }
    if (inputs->empty())
    {
        cerr << "No message file given.\n";
        usage(argv[0]);
        return EXIT_USAGE;
    }

    if (output.empty())
    {
        auto root = ex.default_output_root(*inputs);
        if (!root)
        {
            print_error(root.error());
            return EXIT_USAGE;
        }
        output = *root;
    }

    std::vector<extraction_request> requests;
    requests.reserve(inputs->size());
    for (const auto& input : *inputs)
        requests.push_back(ex.make_request(input, output));

    auto batch = ex.extract_batch(requests,
        [](std::size_t, std::size_t, const extraction_request& req, const extraction_result& res)
        {
            if (res.ok())
            {
                for (const auto& written : res.written_paths)
                    cout << emlxx::detail::path_utf8(written) << "\n";
                return;
            }
            cerr << emlxx::detail::path_utf8(req.source_path) << ": ";
            print_error(*res.error);
        });

    const auto& summary = batch.summary;
    cout << "Succeeded: " << summary.succeeded << ", failed: " << summary.failed
         << ", attachments: " << summary.attachments << "\n"
         << "Output: " << emlxx::detail::path_utf8(output) << "\n";
    return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
