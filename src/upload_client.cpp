// upload_client.cpp
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <utility>
#include "hex.h"
#include "upload_client.h"

using json = nlohmann::json;

namespace
{
    struct CurlDeleter
    {
        void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
    };

    struct MimeDeleter
    {
        void operator()(curl_mime *mime) const { curl_mime_free(mime); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
    using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

    constexpr long CONNECT_TIMEOUT_SECONDS = 10;

    struct HttpResponse
    {
        CURLcode code;
        long status;
        std::string body;
    };

    size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
        return size * nmemb;
    }

    CurlHandle make_handle(const std::string &url)
    {
        CurlHandle curl(curl_easy_init());
        if (!curl)
            return curl;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        return curl;
    }

    HttpResponse perform(CURL *curl)
    {
        HttpResponse response{CURLE_OK, 0, ""};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        response.code = curl_easy_perform(curl);
        if (response.code == CURLE_OK)
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

    void add_form_field(curl_mime *mime, const char *name, const std::string &value)
    {
        curl_mimepart *part = curl_mime_addpart(mime);
        if (part == nullptr || curl_mime_name(part, name) != CURLE_OK ||
            curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED) != CURLE_OK)
            throw UploadFailed(std::string("Cannot build form field '") + name + "'");
    }

    std::string task_id_string(const json &value)
    {
        if (value.is_string())
            return value.get<std::string>();
        return value.dump();
    }

    bool is_readable_file(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            return false;
        std::ifstream in(path, std::ios::binary);
        return in.good();
    }
}

Challenge parse_challenge(const std::string &body)
{
    json data;
    try
    {
        data = json::parse(body);
    }
    catch (const json::parse_error &e)
    {
        throw ChallengeFetchFailed(std::string("Malformed challenge response: ") + e.what());
    }

    try
    {
        if (!data.is_object() || !data.value("success", false))
            throw ChallengeFetchFailed("Challenge request failed");

        const long long n = data.at("N").get<long long>();
        if (n < 0)
            throw ChallengeFetchFailed("Challenge difficulty is negative: " + std::to_string(n));

        Challenge challenge;
        // anything this large is rejected later as unsatisfiable
        challenge.difficulty_bits = static_cast<unsigned>(
            std::min<long long>(n, std::numeric_limits<unsigned>::max()));
        challenge.prefix = from_hex(data.at("pref").get<std::string>());
        challenge.task_id = task_id_string(data.at("taskId"));
        challenge.ip = data.value("ip", std::string());
        return challenge;
    }
    catch (const json::exception &e)
    {
        throw ChallengeFetchFailed(std::string("Invalid challenge response: ") + e.what());
    }
    catch (const std::invalid_argument &e)
    {
        throw ChallengeFetchFailed(std::string("Invalid challenge prefix: ") + e.what());
    }
}

std::string parse_upload_response(const std::string &body)
{
    json result;
    try
    {
        result = json::parse(body);
    }
    catch (const json::parse_error &e)
    {
        throw UploadFailed(std::string("Malformed upload response: ") + e.what());
    }

    std::string url;
    try
    {
        if (!result.is_object() || !result.value("success", false))
            throw UploadFailed("Upload failed");

        auto it = result.find("result");
        if (it != result.end() && it->is_object())
            url = it->value("url", std::string());
    }
    catch (const json::exception &e)
    {
        throw UploadFailed(std::string("Invalid upload response: ") + e.what());
    }
    if (url.empty())
        throw UploadFailed("Upload response carries no url");
    return url;
}

ImageUploader::ImageUploader(std::string endpoint, PowOptions options)
    : endpoint_(std::move(endpoint)), options_(std::move(options))
{
    while (!endpoint_.empty() && endpoint_.back() == '/')
        endpoint_.pop_back();
}

Challenge ImageUploader::get_challenge() const
{
    CurlHandle curl = make_handle(endpoint_ + "/api2/challenge");
    if (!curl)
        throw ChallengeFetchFailed("curl_easy_init failed");

    HttpResponse response = perform(curl.get());
    if (response.code != CURLE_OK)
        throw ChallengeFetchFailed(std::string("Failed to get challenge: ") + curl_easy_strerror(response.code));
    if (response.status != 200)
        throw ChallengeFetchFailed("Failed to get challenge: " + std::to_string(response.status));

    return parse_challenge(response.body);
}

std::string ImageUploader::find_suffix(const Challenge &challenge) const
{
    std::cout << "Starting proof of work calculation (difficulty N = "
              << challenge.difficulty_bits << " bits)...\n";

    PowResult result = run_pow(challenge.prefix, challenge.difficulty_bits, options_);
    if (!result.found)
        throw SolveStopped("Proof of work stopped after " + result.seconds + " seconds without a suffix");

    std::cout << "Valid suffix found! (" << result.attempts << " attempts, "
              << result.seconds << " seconds)\n";
    return result.suffix_hex;
}

std::string ImageUploader::upload_image(const std::string &path, const std::string &task_id,
                                        const std::string &suffix_hex) const
{
    CurlHandle curl = make_handle(endpoint_ + "/api2/upload");
    if (!curl)
        throw UploadFailed("curl_easy_init failed");

    MimeHandle mime(curl_mime_init(curl.get()));
    if (!mime)
        throw UploadFailed("curl_mime_init failed");

    curl_mimepart *part = curl_mime_addpart(mime.get());
    if (part == nullptr || curl_mime_name(part, "file") != CURLE_OK ||
        curl_mime_filedata(part, path.c_str()) != CURLE_OK)
        throw UploadFailed("Cannot attach file '" + path + "'");

    add_form_field(mime.get(), "taskId", task_id);
    add_form_field(mime.get(), "suff", suffix_hex);

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

    std::cout << "Uploading...\n";
    HttpResponse response = perform(curl.get());
    if (response.code != CURLE_OK)
        throw UploadFailed(std::string("Upload request failed: ") + curl_easy_strerror(response.code));
    if (response.status < 200 || response.status >= 300)
        throw UploadFailed("Upload request failed: " + std::to_string(response.status));

    return parse_upload_response(response.body);
}

std::string ImageUploader::process_file(const std::string &path) const
{
    if (!is_readable_file(path))
        throw FileNotFound("File '" + path + "' does not exist");

    Challenge challenge = get_challenge();
    std::cout << "Challenge received: Difficulty N=" << challenge.difficulty_bits
              << " bits, IP=" << challenge.ip << "\n";

    std::string suffix_hex = find_suffix(challenge);

    std::cout << "Uploading image: " << path << "...\n";
    std::string url = upload_image(path, challenge.task_id, suffix_hex);

    std::cout << "Upload successful: " << path << "\n";
    return url;
}

std::vector<UploadOutcome> ImageUploader::process_files(const std::vector<std::string> &paths) const
{
    std::vector<UploadOutcome> outcomes;
    outcomes.reserve(paths.size());
    for (const std::string &path : paths)
    {
        std::cout << "\nProcessing file: " << path << "\n";
        UploadOutcome outcome{path, "", ""};
        try
        {
            outcome.url = process_file(path);
        }
        catch (const std::exception &e)
        {
            outcome.error = e.what();
            std::cerr << "Error processing file '" << path << "': " << e.what() << "\n";
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

int upload_exit_status(const std::vector<UploadOutcome> &outcomes)
{
    for (const auto &outcome : outcomes)
    {
        if (!outcome.ok())
            return 1;
    }
    return 0;
}
