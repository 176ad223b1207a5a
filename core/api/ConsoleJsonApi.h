#pragma once

#include <string>

#include "layers/application/application_layer.h"

namespace api {

// One JSON document per line: a command object or an array of commands.
// Every line yields exactly one compact JSON line in return.
class ConsoleJsonApi
{
public:
    explicit ConsoleJsonApi(application::ApplicationCore& applicationCore);

    std::string handleLine(const std::string& jsonLine) const;

private:
    application::ApplicationCore& m_applicationCore;
};

} // namespace api
