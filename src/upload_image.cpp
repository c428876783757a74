/** \brief Upload files to a proof-of-work protected image host.

For each path a challenge is fetched, solved and the file is uploaded with the
proof.  A failure only skips the file it happened on.
Syntax: upload_image <endpoint> <imagePath>... [--workers N] [--timeout SECONDS]
*/
#include <curl/curl.h>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "cli_args.h"
#include "upload_client.h"

namespace
{
    void usage(const char *program)
    {
        std::cerr << "Usage: " << program
                  << " <endpoint> <imagePath>... [--workers N] [--timeout SECONDS]\n";
    }

    struct CurlGlobal
    {
        CurlGlobal()
        {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                throw std::runtime_error("curl_global_init failed");
        }
        ~CurlGlobal() { curl_global_cleanup(); }
    };
}

int main(int argc, char *argv[])
{
    UploadArgs args;
    try
    {
        args = parse_upload_args(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    std::mutex output_mutex;
    args.options.on_progress = [&output_mutex](int worker_id, uint64_t attempts)
    {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "Thread " << worker_id << " has tried " << attempts << " times...\n";
    };

    try
    {
        CurlGlobal curl_global;
        ImageUploader uploader(args.endpoint, args.options);

        std::vector<UploadOutcome> outcomes = uploader.process_files(args.paths);

        size_t successful_uploads = 0;
        for (const auto &outcome : outcomes)
        {
            if (outcome.ok())
                ++successful_uploads;
        }

        std::cout << "\nUpload complete: " << successful_uploads << "/" << outcomes.size()
                  << " files successfully uploaded\n";

        if (successful_uploads > 0)
        {
            std::cout << "Upload links:\n";
            for (const auto &outcome : outcomes)
            {
                if (outcome.ok())
                    std::cout << outcome.url << "\n";
            }
        }

        return upload_exit_status(outcomes);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
