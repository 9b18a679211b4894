#pragma once

#include <chrono>
#include <string>

#include <curl/curl.h>

#include "../errors/http_error.hpp"
#include "../expected.hpp"

namespace pmx::adapters {

/**
 * @brief Classify the outcome of a libcurl transfer as a transport failure
 *
 * Called by the fetch collaborator right after curl_easy_perform():
 * @code
 *   CURLcode rc = curl_easy_perform(curl);
 *   long status = 0;
 *   curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
 *   auto outcome = pmx::adapters::classify_curl_result(rc, url, status, body, 30s);
 *   if (!outcome) {
 *       return pmx::fail(std::move(outcome).error());
 *   }
 * @endcode
 *
 * @param code Result of curl_easy_perform()
 * @param url Exact URL of the transfer
 * @param response_code CURLINFO_RESPONSE_CODE (0 when no response arrived)
 * @param body Response body received so far
 * @param timeout Time limit configured with CURLOPT_TIMEOUT
 * @return Empty value on success, HttpError otherwise
 */
[[nodiscard]] expected<void, HttpError> classify_curl_result(CURLcode code, std::string url,
                                                             long response_code, std::string body,
                                                             std::chrono::seconds timeout);

} // namespace pmx::adapters
