// ==============================================================================
// client.cpp - Запросы к EVE API
// ==============================================================================

#include "eveapi/client.hpp"

#include "eveapi/output.hpp"

#include <pugixml.hpp>

namespace eveapi {

namespace {

constexpr long HTTP_OK = 200;

ApiError make_error(ApiErrorKind kind, std::string message, std::string url = {}) {
    ApiError err;
    err.kind = kind;
    err.message = std::move(message);
    err.url = std::move(url);
    return err;
}

/// Текст <error> из тела ответа, если сервер его прислал
std::optional<std::string> server_error_text(const std::string& body) {
    pugi::xml_document doc;
    if (!doc.load_buffer(body.data(), body.size())) {
        return std::nullopt;
    }
    pugi::xml_node error = doc.document_element().child("error");
    if (!error) {
        return std::nullopt;
    }
    std::string text = trim_text(error.child_value());
    pugi::xml_attribute code = error.attribute("code");
    if (code) {
        text = "error " + std::string(code.value()) + ": " + text;
    }
    return text;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// ApiError
// ----------------------------------------------------------------------------

const char* api_error_kind_to_string(ApiErrorKind kind) {
    switch (kind) {
    case ApiErrorKind::Network:
        return "network";
    case ApiErrorKind::HttpStatus:
        return "http status";
    case ApiErrorKind::Parse:
        return "parse";
    case ApiErrorKind::MalformedResponse:
        return "malformed response";
    case ApiErrorKind::Config:
        return "config";
    }
    return "unknown";
}

std::string ApiError::format() const {
    std::string out = "[!] ";
    out += api_error_kind_to_string(kind);
    out += " error: ";
    out += message;
    if (!url.empty()) {
        out += " (" + url + ")";
    }
    out += "\n";
    return out;
}

// ----------------------------------------------------------------------------
// parse_response
// ----------------------------------------------------------------------------

ApiResult parse_response(const std::string& xml, bool return_xml, const ConvertOptions& options) {
    ApiResult result;
    if (return_xml) {
        result.raw_xml = xml;
    }

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        result.error = make_error(ApiErrorKind::Parse,
                                  std::string("XML parse error: ") + parsed.description() +
                                      " at offset " + std::to_string(parsed.offset));
        return result;
    }

    try {
        result.value = convert_document(doc, options);
    } catch (const MalformedResponseError& e) {
        result.error = make_error(ApiErrorKind::MalformedResponse, e.what());
        return result;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Client
// ----------------------------------------------------------------------------

Client::Client(config::ClientConfig cfg, output::Writer* writer)
    : config_(std::move(cfg)), writer_(writer) {
    TransportOptions topt;
    topt.timeout_seconds = config_.timeout_seconds;
    topt.user_agent = config_.user_agent;
    transport_ = create_curl_transport(topt);
}

Client::Client(config::ClientConfig cfg, std::unique_ptr<Transport> transport,
               output::Writer* writer)
    : config_(std::move(cfg)), transport_(std::move(transport)), writer_(writer) {}

std::optional<EveApiMethod> Client::method(std::string_view name_or_path) const {
    if (auto known = find_method(name_or_path, config_.api_home)) {
        return known;
    }
    // Произвольный метод, не попавший в каталог
    if (!name_or_path.empty() && name_or_path.front() == '/') {
        return EveApiMethod(std::string(name_or_path), config_.api_home);
    }
    return std::nullopt;
}

ApiResult Client::send_request(const EveApiMethod& method, const RequestParams& params,
                               const RequestOptions& options) {
    const bool use_https = options.use_https.value_or(config_.use_https);
    const std::string url = method.full_url(params, use_https);

    if (method.api_home().empty()) {
        ApiResult result;
        result.error = make_error(ApiErrorKind::Config, "API host is empty", url);
        return result;
    }

    if (writer_ != nullptr) {
        writer_->info("Sending request to EVE API (" + method.api_home() +
                      ") server: " + method.method());
        writer_->debug("GET " + url);
    }

    TransportResult fetched = transport_->get(url);
    if (!fetched) {
        ApiResult result;
        result.error = make_error(ApiErrorKind::Network, fetched.error, url);
        return result;
    }

    const HttpResponse& response = fetched.response;
    if (writer_ != nullptr) {
        writer_->debug("HTTP " + std::to_string(response.status) + ", " +
                       std::to_string(response.body.size()) + " bytes");
        writer_->trace(response.body);
    }

    if (response.status != HTTP_OK) {
        ApiResult result;
        result.http_status = response.status;
        if (options.return_xml) {
            result.raw_xml = response.body;
        }
        std::string message = "server answered with HTTP " + std::to_string(response.status);
        if (auto server_text = server_error_text(response.body)) {
            message += " (" + *server_text + ")";
        }
        result.error = make_error(ApiErrorKind::HttpStatus, std::move(message), url);
        return result;
    }

    ApiResult result = parse_response(response.body, options.return_xml);
    result.http_status = response.status;
    if (result.error) {
        result.error->url = url;
    }
    return result;
}

}  // namespace eveapi
