// ==============================================================================
// eveapi/method.hpp - Методы EVE API и построение URL запроса
// ==============================================================================
//
// Назначение:
// - EveApiMethod: путь метода + хост API
// - compose_url: "/account/Characters.xml.aspx?keyID=1&vCode=abc"
// - Статический каталог известных методов (имя константы -> путь)
//
// ==============================================================================

#ifndef EVEAPI_METHOD_HPP
#define EVEAPI_METHOD_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eveapi {

/// Хост API по умолчанию
constexpr const char* EVE_API_URL = "api.eve-central.com";

/// Суффикс, который сервер ожидает после пути метода
constexpr const char* METHOD_SUFFIX = ".xml.aspx";

/// Параметры запроса. Упорядочены по ключу, URL детерминирован.
using RequestParams = std::map<std::string, std::string>;

// ----------------------------------------------------------------------------
// EveApiMethod
// ----------------------------------------------------------------------------

/// Произвольный метод EVE API.
///
/// @code
///   EveApiMethod custom("/api/CustomMethodName", "example.com");
///   custom.compose_url({{"param1", "value1"}});
///   // "/api/CustomMethodName.xml.aspx?param1=value1"
/// @endcode
class EveApiMethod {
public:
    explicit EveApiMethod(std::string method, std::string api_home = EVE_API_URL)
        : method_(std::move(method)), api_home_(std::move(api_home)) {}

    /// Путь метода, например "/account/Characters"
    const std::string& method() const { return method_; }

    /// Хост сервера API
    const std::string& api_home() const { return api_home_; }

    /// Тот же метод на другом хосте
    EveApiMethod with_home(std::string api_home) const {
        return EveApiMethod(method_, std::move(api_home));
    }

    /// Путь запроса с query string (без схемы и хоста).
    /// '?' добавляется только при непустых параметрах.
    std::string compose_url(const RequestParams& params = {}) const;

    /// Полный URL: "https://<api_home><compose_url>"
    std::string full_url(const RequestParams& params = {}, bool use_https = true) const;

    bool operator==(const EveApiMethod& other) const {
        return method_ == other.method_ && api_home_ == other.api_home_;
    }

private:
    std::string method_;
    std::string api_home_;
};

// ----------------------------------------------------------------------------
// Кодирование query string
// ----------------------------------------------------------------------------

/// application/x-www-form-urlencoded для одного значения:
/// A-Z a-z 0-9 _ . - без изменений, пробел -> '+', остальное -> %XX
std::string url_encode(std::string_view value);

/// "k1=v1&k2=v2" в порядке ключей
std::string encode_query(const RequestParams& params);

// ----------------------------------------------------------------------------
// Каталог методов
// ----------------------------------------------------------------------------

struct MethodEntry {
    const char* name;  // Имя константы, например "SERVER_STATUS"
    const char* path;  // Путь метода, например "/server/ServerStatus"
};

/// Все известные методы, сгруппированы: account, char, corp, eve, map, server
const std::vector<MethodEntry>& method_catalog();

/// Найти метод по имени константы ("CHAR_WALLET_JOURNAL", без учёта регистра)
/// или по пути ("/char/WalletJournal").
std::optional<EveApiMethod> find_method(std::string_view name_or_path,
                                        const std::string& api_home = EVE_API_URL);

}  // namespace eveapi

#endif  // EVEAPI_METHOD_HPP
