/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <fstream>
#include <memory>
#include <string>

typedef void CURL;

namespace systrack {

struct HttpError {
    enum class Kind { Connection, Status, Transfer };

    Kind kind = Kind::Transfer;
    long status = 0;
    std::string message;
};

// Seam between SpeedTest and the network so the server-list and install
// paths can run against canned responses.
class HttpFetcher {
   public:
    virtual ~HttpFetcher() = default;

    virtual std::expected<std::string, HttpError> get(const std::string& url) = 0;
    virtual std::expected<void, HttpError> download(const std::string& url,
                                                    const std::string& filepath) = 0;
};

// libcurl-backed fetcher. The first instance performs the process-wide
// OpenSSL and curl initialisation, which is released at exit.
class HttpClient final : public HttpFetcher {
   public:
    HttpClient();
    ~HttpClient() override = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<std::string, HttpError> get(const std::string& url) override;
    std::expected<void, HttpError> download(const std::string& url, const std::string& filepath) override;

   private:
    std::unique_ptr<CURL, void (*)(CURL*)> handle_;

    static size_t write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept;
    static size_t write_file(void* ptr, size_t size, size_t nmemb, std::ofstream* f) noexcept;
};

}  // namespace systrack
