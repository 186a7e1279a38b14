// ==============================================================================
// transport.cpp - HTTP(S) GET через libcurl
// ==============================================================================

#include <eveapi/transport.hpp>

#include <curl/curl.h>
#include <new>
#include <stdexcept>

namespace eveapi {

namespace {

/// curl_global_init/cleanup на время жизни процесса
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

class CurlTransport : public Transport {
public:
    explicit CurlTransport(TransportOptions options) : options_(std::move(options)) {
        static CurlGlobal global;
    }

    TransportResult get(const std::string& url) override {
        TransportResult result;

        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            result.error = "could not initialise libcurl handle";
            return result;
        }

        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_response_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.response.body);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        if (options_.timeout_seconds > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
        }
        if (!options_.user_agent.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        }

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            result.error = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                   : std::string(curl_easy_strerror(res));
            return result;
        }

        res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.response.status);
        if (res != CURLE_OK) {
            result.error = std::string("could not read response code: ") + curl_easy_strerror(res);
            return result;
        }
        result.ok = true;
        return result;
    }

private:
    TransportOptions options_;
};

}  // namespace

std::size_t append_response_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (body == nullptr) {
        return 0;
    }
    const std::size_t n = size * nmemb;
    // Исключение не должно пройти через C-кадры libcurl
    try {
        body->append(ptr, n);
    } catch (const std::bad_alloc&) {
        return 0;
    } catch (const std::length_error&) {
        return 0;
    }
    return n;
}

std::unique_ptr<Transport> create_curl_transport(const TransportOptions& options) {
    return std::make_unique<CurlTransport>(options);
}

}  // namespace eveapi
