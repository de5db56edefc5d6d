/**
 * @file certauth_check.cpp
 * @brief certauth-check - run one client certificate through the decision engine
 *
 * Usage: certauth-check <cert-file> [--insecure-channel]
 *
 * Reads a PEM or DER certificate, loads options and trust/revocation sources
 * from the environment, authenticates once and prints the result as JSON.
 *
 * Exit codes: 0 = Valid, 1 = Rejected, 2 = NoResult, 3 = fatal error.
 */

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "certauth/auth/decision_engine.h"
#include "certauth/common/exceptions.h"
#include "certauth/common/logger.h"
#include "certauth/validation/chain_validator.h"
#include "certauth/validation/providers.h"
#include "certauth/x509/certificate_parser.h"

namespace {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_NO_RESULT = 2;
constexpr int EXIT_FATAL = 3;

/**
 * @brief Tool configuration (environment only)
 */
struct CliConfig {
    std::string trustBundle;   ///< CERTAUTH_TRUST_BUNDLE
    std::string crlFile;       ///< CERTAUTH_CRL_FILE
    int timeoutMs = 0;         ///< CERTAUTH_TIMEOUT_MS (0 = none)
    std::string logLevel = "warn";
    std::string logFile;

    static CliConfig fromEnvironment() {
        CliConfig config;

        if (auto val = std::getenv("CERTAUTH_TRUST_BUNDLE")) config.trustBundle = val;
        if (auto val = std::getenv("CERTAUTH_CRL_FILE")) config.crlFile = val;
        if (auto val = std::getenv("CERTAUTH_TIMEOUT_MS")) {
            try {
                config.timeoutMs = std::stoi(val);
            } catch (const std::exception&) {
                throw certauth::common::ConfigException(
                    std::string("CERTAUTH_TIMEOUT_MS must be an integer, got '") + val + "'");
            }
            if (config.timeoutMs < 0) {
                throw certauth::common::ConfigException("CERTAUTH_TIMEOUT_MS must not be negative");
            }
        }
        if (auto val = std::getenv("LOG_LEVEL")) config.logLevel = val;
        if (auto val = std::getenv("LOG_FILE")) config.logFile = val;

        return config;
    }
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <cert-file> [--insecure-channel]\n"
              << "\n"
              << "Environment:\n"
              << "  CERTAUTH_TRUST_BUNDLE              PEM bundle of trusted roots/intermediates\n"
              << "  CERTAUTH_CRL_FILE                  PEM/DER CRL file\n"
              << "  CERTAUTH_TIMEOUT_MS                Deadline for the attempt\n"
              << "  CERTAUTH_ALLOWED_TYPES             Chained | SelfSigned | All\n"
              << "  CERTAUTH_REVOCATION_FLAG           EndCertificateOnly | EntireChain | ExcludeRoot\n"
              << "  CERTAUTH_REVOCATION_MODE           NoCheck | Online | OnlineBestEffort | Offline\n"
              << "  CERTAUTH_VALIDATE_CERTIFICATE_USE  true | false\n"
              << "  CERTAUTH_VALIDATE_VALIDITY_PERIOD  true | false\n"
              << "  CERTAUTH_CLAIMS_ISSUER             Issuer label on claims\n"
              << "  LOG_LEVEL, LOG_FILE                Logging\n";
}

void printJson(const Json::Value& json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, json) << std::endl;
}

int exitCodeFor(const certauth::auth::AuthenticateResult& result) {
    if (result.isFatal()) return EXIT_FATAL;
    const auto& outcome = result.outcome();
    if (outcome.isValid()) return EXIT_VALID;
    if (outcome.isNoResult()) return EXIT_NO_RESULT;
    return EXIT_REJECTED;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace certauth;

    std::string certPath;
    bool channelSecured = true;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--insecure-channel") {
            channelSecured = false;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EXIT_VALID;
        } else if (certPath.empty()) {
            certPath = arg;
        } else {
            printUsage(argv[0]);
            return EXIT_FATAL;
        }
    }

    if (certPath.empty()) {
        printUsage(argv[0]);
        return EXIT_FATAL;
    }

    try {
        CliConfig config = CliConfig::fromEnvironment();
        common::Logger::initialize("certauth-check", config.logLevel,
                                   !config.logFile.empty(), config.logFile);

        auth::CertificateAuthenticationOptions options =
            auth::CertificateAuthenticationOptions::fromEnvironment();

        validation::StaticTrustAnchorProvider anchors;
        if (!config.trustBundle.empty()) {
            anchors = validation::StaticTrustAnchorProvider::fromPemBundle(config.trustBundle);
        }

        validation::StaticCrlProvider crls;
        if (!config.crlFile.empty()) {
            crls = validation::StaticCrlProvider::fromFile(config.crlFile);
        }

        validation::ChainValidator validator(&anchors, &crls);
        auth::CertificateAuthenticationEngine engine(std::move(options), &validator);

        auth::AuthenticationRequest request;
        request.channelSecured = channelSecured;
        request.clientCertificate = x509::parseCertificate(x509::readFileBytes(certPath)).rawData();
        request.context["source"] = certPath;

        validation::CancellationSource source;
        validation::CancellationToken token = source.token();
        if (config.timeoutMs > 0) {
            token = token.withTimeout(std::chrono::milliseconds(config.timeoutMs));
        }

        auth::AuthenticateResult result = engine.authenticate(request, token);

        Json::Value json = result.toJson();
        json["httpStatus"] = auth::responseStatusFor(result);
        printJson(json);

        common::Logger::flush();
        return exitCodeFor(result);

    } catch (const std::exception& e) {
        spdlog::error("certauth-check failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    }
}
