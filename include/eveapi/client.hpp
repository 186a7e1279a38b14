// ==============================================================================
// eveapi/client.hpp - Запросы к EVE API
// ==============================================================================
//
// Назначение:
// - send_request: URL -> GET -> XML (pugixml) -> Value
// - Перевод сбоев транспорта и разбора в ApiError
//
// Использование:
// @code
//   eveapi::Client client(eveapi::config::default_config());
//   auto result = client.send_request(*eveapi::find_method("SERVER_STATUS"));
//   if (!result) {
//       std::cerr << result.error->format();
//       return;
//   }
//   const std::string* players =
//       result.value.find_string("eveapi.result.onlinePlayers.text");
// @endcode
//
// ==============================================================================

#ifndef EVEAPI_CLIENT_HPP
#define EVEAPI_CLIENT_HPP

#include <eveapi/config.hpp>
#include <eveapi/convert.hpp>
#include <eveapi/method.hpp>
#include <eveapi/transport.hpp>
#include <eveapi/value.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace eveapi {

namespace output {
class Writer;
}  // namespace output

// ----------------------------------------------------------------------------
// ApiError - ошибки запроса
// ----------------------------------------------------------------------------

enum class ApiErrorKind {
    Network,            // Соединение, DNS, TLS, таймаут
    HttpStatus,         // Ответ со статусом, отличным от 200
    Parse,              // Тело ответа: не корректный XML
    MalformedResponse,  // XML корректен, но нарушает структуру протокола
    Config              // Некорректная конфигурация клиента
};

const char* api_error_kind_to_string(ApiErrorKind kind);

struct ApiError {
    ApiErrorKind kind = ApiErrorKind::Network;
    std::string message;
    std::string url;

    /// "[!] <kind> error: <message> (<url>)\n"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Запрос и результат
// ----------------------------------------------------------------------------

struct RequestOptions {
    /// Вернуть также исходный XML ответа
    bool return_xml = false;

    /// HTTPS вместо HTTP; по умолчанию: из конфигурации клиента
    std::optional<bool> use_https;
};

struct ApiResult {
    bool ok = false;
    Value value;
    std::optional<std::string> raw_xml;
    long http_status = 0;
    std::optional<ApiError> error;

    explicit operator bool() const { return ok; }
};

/// Разобрать XML ответа и конвертировать его в Value.
/// Ошибки разбора -> ApiErrorKind::Parse, ошибки структуры -> MalformedResponse.
ApiResult parse_response(const std::string& xml, bool return_xml = false,
                         const ConvertOptions& options = {});

// ----------------------------------------------------------------------------
// Client
// ----------------------------------------------------------------------------

class Client {
public:
    /// Клиент с транспортом libcurl
    explicit Client(config::ClientConfig cfg, output::Writer* writer = nullptr);

    /// Клиент с заданным транспортом
    Client(config::ClientConfig cfg, std::unique_ptr<Transport> transport,
           output::Writer* writer = nullptr);

    /// Отправить запрос и обработать ответ
    ApiResult send_request(const EveApiMethod& method, const RequestParams& params = {},
                           const RequestOptions& options = {});

    /// Метод из каталога (или путь "/group/Name") на хосте из конфигурации
    std::optional<EveApiMethod> method(std::string_view name_or_path) const;

    const config::ClientConfig& config() const { return config_; }

private:
    config::ClientConfig config_;
    std::unique_ptr<Transport> transport_;
    output::Writer* writer_;
};

}  // namespace eveapi

#endif  // EVEAPI_CLIENT_HPP
