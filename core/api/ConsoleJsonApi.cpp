#include "ConsoleJsonApi.h"

#include <boost/json.hpp>

namespace api {

namespace json = boost::json;

ConsoleJsonApi::ConsoleJsonApi(application::ApplicationCore& applicationCore)
    : m_applicationCore(applicationCore)
{
}

std::string ConsoleJsonApi::handleLine(const std::string& jsonLine) const
{
    boost::system::error_code ec;
    const json::value document = json::parse(jsonLine, ec);

    if (ec || !(document.is_object() || document.is_array())) {
        json::object errorResponse;
        errorResponse["status"] = "error";
        errorResponse["code"] = "invalid_request";
        errorResponse["error"] = ec ? "Invalid JSON: " + ec.message() : std::string("Expected object or array");
        return json::serialize(errorResponse);
    }

    if (document.is_array()) {
        return json::serialize(m_applicationCore.executeBatch(document.as_array()));
    }
    return json::serialize(m_applicationCore.executeJson(document));
}

} // namespace api
