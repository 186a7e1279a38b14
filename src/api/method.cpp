// ==============================================================================
// method.cpp - EveApiMethod, кодирование query string, каталог методов
// ==============================================================================

#include <eveapi/method.hpp>

#include <algorithm>
#include <cctype>

namespace eveapi {

// ----------------------------------------------------------------------------
// Кодирование
// ----------------------------------------------------------------------------

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '.' || c == '-';
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string url_encode(std::string_view value) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string encode_query(const RequestParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

// ----------------------------------------------------------------------------
// EveApiMethod
// ----------------------------------------------------------------------------

std::string EveApiMethod::compose_url(const RequestParams& params) const {
    std::string url = method_ + METHOD_SUFFIX;
    if (!params.empty()) {
        url += '?';
        url += encode_query(params);
    }
    return url;
}

std::string EveApiMethod::full_url(const RequestParams& params, bool use_https) const {
    return std::string(use_https ? "https://" : "http://") + api_home_ + compose_url(params);
}

// ----------------------------------------------------------------------------
// Каталог
// ----------------------------------------------------------------------------

const std::vector<MethodEntry>& method_catalog() {
    static const std::vector<MethodEntry> catalog = {
    {"ACCOUNT_CHARACTERS", "/account/Characters"},
    {"ACCOUNT_STATUS", "/account/AccountStatus"},

    {"CHAR_ACCOUNT_BALANCES", "/char/AccountBalance"},
    {"CHAR_ASSET_LIST", "/char/AssetList"},
    {"CHAR_CALENDAR_EVENT_ATTENDEES", "/char/CalendarEventAttendees"},
    {"CHAR_CHARACTER_SHEET", "/char/CharacterSheet"},
    {"CHAR_CONTACT_LIST", "/char/ContactList"},
    {"CHAR_CONTACT_NOTIFICATIONS", "/char/ContactNotifications"},
    {"CHAR_CONTRACTS", "/char/Contracts"},
    {"CHAR_CONTRACT_ITEMS", "/char/ContractItems"},
    {"CHAR_CONTRACT_BIDS", "/char/ContractBids"},
    {"CHAR_FACTIONAL_WARFARE_STATS", "/char/FacWarStats"},
    {"CHAR_INDUSTRY_JOBS", "/char/IndustryJobs"},
    {"CHAR_KILL_LOG", "/char/Killlog"},
    {"CHAR_MAIL_BODIES", "/char/MailBodies"},
    {"CHAR_MAILING_LISTS", "/char/MailingLists"},
    {"CHAR_MAIL_MESSAGES", "/char/MailMessages"},
    {"CHAR_MARKET_ORDERS", "/char/MarketOrders"},
    {"CHAR_MEDALS", "/char/Medals"},
    {"CHAR_NOTIFICATIONS", "/char/Notifications"},
    {"CHAR_NOTIFICATION_TEXTS", "/char/NotificationTexts"},
    {"CHAR_RESEARCH", "/char/Research"},
    {"CHAR_SKILL_IN_TRAINING", "/char/SkillInTraining"},
    {"CHAR_SKILL_QUEUE", "/char/SkillQueue"},
    {"CHAR_STANDINGS", "/char/Standings"},
    {"CHAR_UPCOMING_CALENDAR_EVENTS", "/char/UpcomingCalendarEvents"},
    {"CHAR_WALLET_JOURNAL", "/char/WalletJournal"},
    {"CHAR_WALLET_TRANSACTIONS", "/char/WalletTransactions"},

    {"CORP_ACCOUNT_BALANCES", "/corp/AccountBalance"},
    {"CORP_ASSET_LIST", "/corp/AssetList"},
    {"CORP_CONTACT_LIST", "/corp/ContactList"},
    {"CORP_CONTAINER_LOG", "/corp/ContainerLog"},
    {"CORP_CONTRACTS", "/corp/Contracts"},
    {"CORP_CONTRACT_ITEMS", "/corp/ContractItems"},
    {"CORP_CONTRACT_BIDS", "/corp/ContractBids"},
    {"CORP_CORPORATION_SHEET", "/corp/CorporationSheet"},
    {"CORP_FACTIONAL_WARFARE_STATS", "/corp/FacWarStats"},
    {"CORP_INDUSTRY_JOBS", "/corp/IndustryJobs"},
    {"CORP_KILL_LOG", "/corp/Killlog"},
    {"CORP_MARKET_ORDERS", "/corp/MarketOrders"},
    {"CORP_MEDALS", "/corp/Medals"},
    {"CORP_MEMBER_MEDALS", "/corp/MemberMedals"},
    {"CORP_MEMBER_SECURITY", "/corp/MemberSecurity"},
    {"CORP_MEMBER_SECURITY_LOG", "/corp/MemberSecurityLog"},
    {"CORP_MEMBER_TRACKING", "/corp/MemberTracking"},
    {"CORP_OUTPOST_LIST", "/corp/OutpostList"},
    {"CORP_OUTPOST_SERVICE_DETAIL", "/corp/OutpostServiceDetail"},
    {"CORP_SHAREHOLDERS", "/corp/Shareholders"},
    {"CORP_STANDINGS", "/corp/Standings"},
    {"CORP_STARBASE_DETAILS", "/corp/StarbaseDetail"},
    {"CORP_STARBASE_LIST", "/corp/StarbaseList"},
    {"CORP_TITLES", "/corp/Titles"},
    {"CORP_WALLET_JOURNAL", "/corp/WalletJournal"},
    {"CORP_WALLET_TRANSACTIONS", "/corp/WalletTransactions"},

    {"EVE_ALLIANCE_LIST", "/eve/AllianceList"},
    {"EVE_CERTIFICATE_TREE", "/eve/CertificateTree"},
    {"EVE_CHARACTER_ID", "/eve/CharacterID"},
    {"EVE_CHARACTER_INFO", "/eve/CharacterInfo"},
    {"EVE_CHARACTER_NAME", "/eve/CharacterName"},
    {"EVE_CONQUERABLE_STATION_LIST", "/eve/ConquerableStationList"},
    {"EVE_ERROR_LIST", "/eve/ErrorList"},
    {"EVE_FACTIONAL_WARFARE_STATS", "/eve/FacWarStats"},
    {"EVE_FACTIONAL_WARFARE_TOP_STATS", "/eve/FacWarTopStats"},
    {"EVE_REFTYPES_LIST", "/eve/RefTypes"},
    {"EVE_SKILL_TREE", "/eve/SkillTree"},

    {"MAP_FACTIONAL_WARFARE_SYSTEMS", "/map/FacWarSystems"},
    {"MAP_JUMPS", "/map/Jumps"},
    {"MAP_KILLS", "/map/Kills"},
    {"MAP_SOVEREIGNTY", "/map/Sovereignty"},

    {"SERVER_STATUS", "/server/ServerStatus"},
    };
    return catalog;
}

std::optional<EveApiMethod> find_method(std::string_view name_or_path,
                                        const std::string& api_home) {
    const auto& catalog = method_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(), [&](const MethodEntry& entry) {
        return iequals(entry.name, name_or_path) || name_or_path == entry.path;
    });
    if (it == catalog.end()) {
        return std::nullopt;
    }
    return EveApiMethod(it->path, api_home);
}

}  // namespace eveapi
