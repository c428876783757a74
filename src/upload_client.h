/** \file upload_client.h
\brief Fetch a proof-of-work challenge, solve it and upload a file with the proof.

The upload service hands out a challenge at GET <endpoint>/api2/challenge and
accepts a multipart POST at <endpoint>/api2/upload carrying the file, the
challenge taskId and the hex suffix found by run_pow.

Every failure is reported as an exception local to the file being processed,
so a caller looping over several files can skip the failed one and go on.
*/
#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include "pow_core.h"

/** \brief Challenge request failed, returned an error status or success=false. */
class ChallengeFetchFailed : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** \brief Upload request failed, returned an error status or success=false. */
class UploadFailed : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** \brief The input path is not a readable regular file. */
class FileNotFound : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** \brief The search ended on timeout or cancellation without a suffix. */
class SolveStopped : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Challenge
{
    std::vector<unsigned char> prefix;
    unsigned difficulty_bits = 0;
    std::string task_id;
    std::string ip;
};

/** \brief What happened to one file of a batch. */
struct UploadOutcome
{
    std::string path;
    std::string url;
    std::string error;

    bool ok() const { return error.empty(); }
};

/**
 * \brief Parse the JSON body of a challenge response.
 *
 * \throws ChallengeFetchFailed on malformed JSON, missing fields, a bad hex
 *         prefix or success=false.
 */
Challenge parse_challenge(const std::string &body);

/**
 * \brief Parse the JSON body of an upload response and return result.url.
 *
 * \throws UploadFailed on malformed JSON, success=false or an empty url.
 */
std::string parse_upload_response(const std::string &body);

/** \brief 0 when every file was uploaded, 1 otherwise. */
int upload_exit_status(const std::vector<UploadOutcome> &outcomes);

class ImageUploader
{
public:
    /**
     * \param endpoint API base address, a trailing slash is ignored.
     * \param options  Solver settings used for every file.
     */
    explicit ImageUploader(std::string endpoint, PowOptions options = PowOptions());

    const std::string &endpoint() const { return endpoint_; }

    Challenge get_challenge() const;

    /** \brief Solve the challenge and return the hex suffix. */
    std::string find_suffix(const Challenge &challenge) const;

    /** \brief Post the file and return the URL the service assigned to it. */
    std::string upload_image(const std::string &path, const std::string &task_id,
                             const std::string &suffix_hex) const;

    /**
     * \brief Run challenge, solve and upload for one file.
     *
     * \throws FileNotFound before any request when path is not a readable file.
     */
    std::string process_file(const std::string &path) const;

    /**
     * \brief Run process_file on every path in order.
     *
     * A failure is logged and recorded in that file's outcome; the remaining
     * paths are still processed.
     */
    std::vector<UploadOutcome> process_files(const std::vector<std::string> &paths) const;

private:
    std::string endpoint_;
    PowOptions options_;
};
