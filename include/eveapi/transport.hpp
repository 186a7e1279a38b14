// ==============================================================================
// eveapi/transport.hpp - HTTP(S) транспорт
// ==============================================================================
//
// Назначение:
// - Transport: абстрактный GET (подменяется в тестах)
// - create_curl_transport: реализация на libcurl
//
// Соединение открывается, используется и закрывается на каждый запрос.
//
// ==============================================================================

#ifndef EVEAPI_TRANSPORT_HPP
#define EVEAPI_TRANSPORT_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace eveapi {

/// Ответ сервера
struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Результат GET: ok=false только при сетевой ошибке (статус не проверяется)
struct TransportResult {
    bool ok = false;
    HttpResponse response;
    std::string error;

    explicit operator bool() const { return ok; }
};

struct TransportOptions {
    long timeout_seconds = 30;  // 0 = без ограничения
    std::string user_agent;
    bool follow_redirects = true;
};

class Transport {
public:
    virtual ~Transport() = default;

    /// Выполнить GET по полному URL
    virtual TransportResult get(const std::string& url) = 0;

protected:
    Transport() = default;
};

/// Транспорт на libcurl
std::unique_ptr<Transport> create_curl_transport(const TransportOptions& options);

/// CURLOPT_WRITEFUNCTION: дописывает блок в std::string* userdata.
/// Возвращает 0 (curl прерывает передачу с CURLE_WRITE_ERROR), если
/// userdata == nullptr или не хватило памяти.
std::size_t append_response_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

}  // namespace eveapi

#endif  // EVEAPI_TRANSPORT_HPP
