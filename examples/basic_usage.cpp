/**
 * @file basic_usage.cpp
 * @brief Basic usage example for ghappauth
 *
 * This example demonstrates how to:
 * - Load a GitHub App private key
 * - Fetch an installation token
 * - Get an Authorization header (refreshed automatically when stale)
 * - Reuse the token's HTTP client for a GitHub API request
 * - Handle errors using the Result type
 *
 * Usage:
 *   basic_usage <app-id> <installation-id> <private-key.pem>
 */

#include <ghappauth/ghappauth.hpp>
#include <ghappauth/http.hpp>

#include <glog/logging.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <app-id> <installation-id> <private-key.pem>\n";
        return 1;
    }

    std::ifstream key_file(argv[3], std::ios::binary);
    if (!key_file) {
        std::cerr << "Cannot open private key file: " << argv[3] << "\n";
        return 1;
    }

    // All four parameters are required. See the AuthParams documentation for
    // where to find the two IDs and how to generate the private key.
    ghappauth::AuthParams params;
    params.user_agent = "my-cool-user-agent";
    params.private_key.assign(std::istreambuf_iterator<char>(key_file),
                              std::istreambuf_iterator<char>());
    try {
        params.app_id = std::stoull(argv[1]);
        params.installation_id = std::stoull(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "App and installation IDs must be numbers: " << e.what() << "\n";
        return 1;
    }

    // Fetching the first token can fail (bad key, wrong IDs, network)
    auto result = ghappauth::InstallationToken::create(params);
    if (result.is_error()) {
        std::cerr << "Failed to get installation token: "
                  << ghappauth::error_code_to_string(result.error_code()) << ": "
                  << result.error_message() << "\n";
        if (result.error().http_status != 0) {
            std::cerr << "HTTP " << result.error().http_status << ": "
                      << result.error().response_body << "\n";
        }
        return 1;
    }

    // The token is mutable because it is refreshed on use
    auto token = std::move(result).value();

    auto header = token.header();
    if (header.is_error()) {
        std::cerr << "Failed to get authentication header: " << header.error_message() << "\n";
        return 1;
    }

    ghappauth::http::Request request;
    request.method = ghappauth::http::Method::GET;
    request.path = "/installation/repositories";
    request.headers = header.value();
    request.headers.emplace("Accept", "application/vnd.github+json");

    auto response = token.client()->send(request);
    if (!response.success) {
        std::cerr << "Request failed: HTTP " << response.status_code << " "
                  << response.error_message << "\n";
        return 1;
    }

    std::cout << response.body << "\n";
    return 0;
}
