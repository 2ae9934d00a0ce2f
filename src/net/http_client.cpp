/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/http_client.hpp"
#include "systrack/config.hpp"
#include "systrack/interrupts.hpp"

#include <cerrno>
#include <filesystem>
#include <format>
#include <span>
#include <stdexcept>
#include <system_error>

#include <curl/curl.h>
#include <openssl/crypto.h>

namespace systrack {

namespace {

constexpr auto kUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";

struct CurlSlistDeleter {
    void operator()(struct curl_slist* list) const noexcept {
        if (list) curl_slist_free_all(list);
    }
};

class CurlHeaders {
    std::unique_ptr<struct curl_slist, CurlSlistDeleter> list_;

   public:
    void add(const std::string& header) {
        auto new_head = curl_slist_append(list_.get(), header.c_str());
        if (new_head && !list_) {
            list_.reset(new_head);
        }
    }

    struct curl_slist* get() const { return list_.get(); }
};

class CurlRuntime {
   public:
    CurlRuntime() {
        if (OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 0) {
            throw std::runtime_error("Failed to initialize OpenSSL crypto library");
        }
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl globally");
        }
    }

    ~CurlRuntime() {
        curl_global_cleanup();
    }

    CurlRuntime(const CurlRuntime&) = delete;
    CurlRuntime& operator=(const CurlRuntime&) = delete;
};

// curl_global_init is not thread-safe on older libcurl; the static guard
// serialises it and a failed init is retried by the next client.
CURL* new_handle() {
    static CurlRuntime runtime;
    return curl_easy_init();
}

void setup_common(CURL* handle, CurlHeaders& headers, long timeout_sec) {
    headers.add("Accept: application/json,text/html;q=0.9,*/*;q=0.8");
    headers.add("Accept-Language: en-US,en;q=0.9");
    headers.add("Cache-Control: no-cache");

    curl_easy_setopt(handle, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, Config::HTTP_CONNECT_TIMEOUT_SEC);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION,
        +[](void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
            return g_interrupted ? 1 : 0;
        });
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
}

bool is_connection_failure(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

// Shared post-processing for get() and download().
std::expected<void, HttpError> check_result(CURL* handle, CURLcode res, std::string_view url) {
    check_interrupted();

    if (res != CURLE_OK) {
        HttpError err;
        err.kind = is_connection_failure(res) ? HttpError::Kind::Connection
                                              : HttpError::Kind::Transfer;
        err.message = std::format("Network error: {}", curl_easy_strerror(res));
        return std::unexpected(std::move(err));
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        HttpError err;
        err.kind = HttpError::Kind::Status;
        err.status = status;
        err.message = status == 403 ? std::format("HTTP 403 Forbidden ({})", url)
                                    : std::format("HTTP {} ({})", status, url);
        return std::unexpected(std::move(err));
    }
    return {};
}

}  // namespace

HttpClient::HttpClient() : handle_(new_handle(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::write_string(void* ptr, size_t size, size_t nmemb, std::string* s) noexcept {
    try {
        size_t total_size = size * nmemb;
        std::span<const char> data_view(static_cast<const char*>(ptr), total_size);

        s->append(data_view.begin(), data_view.end());

        return total_size;
    } catch (const std::bad_alloc&) {
        return 0;
    }
}

size_t HttpClient::write_file(void* ptr, size_t size, size_t nmemb, std::ofstream* f) noexcept {
    size_t total_size = size * nmemb;
    std::span<const char> data_view(static_cast<const char*>(ptr), total_size);

    f->write(data_view.data(), static_cast<std::streamsize>(data_view.size()));

    if (!*f) return 0;
    return total_size;
}

std::expected<std::string, HttpError> HttpClient::get(const std::string& url) {
    curl_easy_reset(handle_.get());

    std::string response;
    CurlHeaders headers;
    setup_common(handle_.get(), headers, Config::HTTP_TIMEOUT_SEC);

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(handle_.get(), CURLOPT_TCP_KEEPALIVE, 1L);

    CURLcode res = curl_easy_perform(handle_.get());

    if (auto ok = check_result(handle_.get(), res, url); !ok) {
        return std::unexpected(ok.error());
    }
    return response;
}

std::expected<void, HttpError> HttpClient::download(const std::string& url,
                                                    const std::string& filepath) {
    curl_easy_reset(handle_.get());

    std::ofstream outfile(filepath, std::ios::binary);
    if (!outfile) {
        return std::unexpected(HttpError{HttpError::Kind::Transfer, 0,
            std::format("Cannot save file '{}': {}", filepath,
                        std::system_category().message(errno))});
    }

    CurlHeaders headers;
    setup_common(handle_.get(), headers, Config::SPEEDTEST_DL_TIMEOUT_SEC);

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, write_file);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &outfile);

    CURLcode res = curl_easy_perform(handle_.get());
    outfile.close();

    auto ok = check_result(handle_.get(), res, url);
    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(filepath, ec);
        return ok;
    }

    return {};
}

}  // namespace systrack
