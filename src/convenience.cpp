#include "convenience.hpp"

#include <utility>

namespace fetch_engine {

std::vector<ResponseRecord>
fetchJsonData(const std::vector<std::string>& urls,
              const std::map<std::string, std::string>& headers,
              int maxConcurrent,
              const RetryConfig& retry,
              ApiClient::TransportFactory factory)
{
    ClientConfig config;
    config.defaultHeaders = headers;
    config.maxConcurrent  = maxConcurrent;
    config.retry          = retry;

    std::vector<RequestDescriptor> requests;
    requests.reserve(urls.size());
    for (const auto& url : urls) {
        RequestDescriptor request;
        request.url = url;
        requests.push_back(std::move(request));
    }

    ApiClient client(config, std::move(factory));
    client.open();
    return client.batch(std::move(requests));
}

} // namespace fetch_engine
