#pragma once

#include "api_client.hpp"
#include "config.hpp"
#include "models.hpp"

#include <map>
#include <string>
#include <vector>

namespace fetch_engine {

/// GET every URL as one batch on a short-lived client; results are in the
/// order of @p urls.
std::vector<ResponseRecord>
fetchJsonData(const std::vector<std::string>& urls,
              const std::map<std::string, std::string>& headers = {},
              int maxConcurrent = 10,
              const RetryConfig& retry = {},
              ApiClient::TransportFactory factory = nullptr);

} // namespace fetch_engine
