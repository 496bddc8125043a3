/**
 * Patterns.cpp - Ordered secret detection rules used by the Sanitizer
 *
 * Rules are evaluated top to bottom. Narrow rules that keep quoting or flag
 * syntax intact sit above the generic key=value heuristics near the end.
 *
 * Every repetition is bounded: std::regex recurses once per repeated
 * character, so an open-ended run over a long command exhausts the stack.
 * A secret longer than its bound is masked in pieces by repeated passes.
 */

#include "rb/Patterns.hpp"

#include <set>
#include <stdexcept>

namespace rb {

static const std::string MASK = "<REDACTED>";

std::vector<PatternSpec> defaultPatternSpecs() {
    return {
        // Password flags, quoted values first since they may contain spaces
        {"password-flag-quoted-double", R"re((--password[=\s]{1,8})"([^"]{1,512})")re", "$1\"" + MASK + "\""},
        {"password-flag-quoted-single", R"re((--password[=\s]{1,8})'([^']{1,512})')re", "$1'" + MASK + "'"},
        {"password-flag-unquoted", R"re((--password[=\s]{1,8})([^'"\s]{1,512}))re", "$1" + MASK},
        {"passwd-flag", R"re((--passwd[=\s]{1,8})(['"]?)([^'"\s]{1,512})(['"]?))re", "$1$2" + MASK + "$4"},
        // MySQL short -p flag, the value must not start with another dash
        {"mysql-password", R"re((\s-p)(['"]?)([^-'"\s][^'"\s]{0,511})(['"]?))re", "$1$2" + MASK + "$4"},

        // Token and API key flags
        {"token-flag", R"re((--token[=\s]{1,8}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"api-key-flag", R"re((--api-key[=\s]{1,8}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"secret-flag", R"re((--secret[=\s]{1,8}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},

        // Environment variable exports
        {"api-key-export", R"re((export\s{1,8}[A-Z_]{0,64}API_?KEY\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"secret-export", R"re((export\s{1,8}[A-Z_]{0,64}SECRET[A-Z_]{0,64}\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"password-export", R"re((export\s{1,8}[A-Z_]{0,64}PASS(?:WORD)?[A-Z_]{0,64}\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"token-export", R"re((export\s{1,8}[A-Z_]{0,64}TOKEN\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},
        {"credentials-export", R"re((export\s{1,8}[A-Z_]{0,64}CRED(?:ENTIAL)?S?[A-Z_]{0,64}\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?))re", "$1" + MASK + "$3"},

        // AWS credentials
        {"aws-access-key-id", R"re((AWS_ACCESS_KEY_ID\s{0,3}=\s{0,3}['"]?)([A-Z0-9]{20})(['"]?))re", "$1" + MASK + "$3"},
        {"aws-secret-key", R"re((AWS_SECRET_ACCESS_KEY\s{0,3}=\s{0,3}['"]?)([A-Za-z0-9/+=]{40})(['"]?))re", "$1" + MASK + "$3"},
        {"aws-session-token", R"re((AWS_SESSION_TOKEN\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,2048})(['"]?))re", "$1" + MASK + "$3"},

        // user:password@ inside URLs
        {"connection-string-password", R"re((://[^:\s]{1,256}:)([^@\s]{1,512})(@))re", "$1" + MASK + "$3"},

        // Authorization headers
        {"bearer-token", R"re((Authorization:\s{0,3}Bearer\s{1,3})([^\s'"]{1,2048}))re", "$1" + MASK},
        {"basic-auth", R"re((Authorization:\s{0,3}Basic\s{1,3})([^\s'"]{1,512}))re", "$1" + MASK},
        {"auth-header-h-flag", R"re((-H\s{1,8}['"]?Authorization:\s{0,3}(?:Bearer|Basic)\s{1,3})([^'"\s]{1,2048})(['"]?))re", "$1" + MASK + "$3"},

        // Key material cannot be partially masked, the whole command goes
        {"private-key", R"re(-----BEGIN\s{1,3}(?:RSA\s{1,3}|EC\s{1,3}|OPENSSH\s{1,3}|ENCRYPTED\s{1,3}|DSA\s{1,3})?PRIVATE\s{1,3}KEY-----)re", "", true},
        {"pgp-private-key", R"re(-----BEGIN\s{1,3}PGP\s{1,3}PRIVATE\s{1,3}KEY\s{1,3}BLOCK-----)re", "", true},

        // GitHub
        {"github-token", R"re(gh[ps]_[A-Za-z0-9]{36,255})re", MASK},
        {"github-pat", R"re(github_pat_[A-Za-z0-9_]{22,255})re", MASK},

        // header.payload.signature
        {"jwt-token", R"re(\beyJ[-A-Za-z0-9_]{1,1024}\.eyJ[-A-Za-z0-9_]{1,2048}\.[-A-Za-z0-9_]{1,1024}\b)re", "<REDACTED_JWT>"},

        // Slack, Discord and webhook URLs
        {"slack-bot-token", R"re(xoxb-[0-9]{1,32}-[0-9]{1,32}-[A-Za-z0-9]{1,128})re", MASK},
        {"slack-user-token", R"re(xoxp-[0-9]{1,32}-[0-9]{1,32}-[0-9]{1,32}-[A-Za-z0-9]{1,128})re", MASK},
        {"slack-app-token", R"re(xapp-[0-9]{1,32}-[A-Za-z0-9]{1,64}-[0-9]{1,32}-[A-Za-z0-9]{1,128})re", MASK},
        {"slack-refresh-token", R"re(xoxr-[0-9]{1,32}-[A-Za-z0-9]{1,128})re", MASK},
        {"slack-webhook", R"re(https://hooks\.slack\.com/services/T[A-Z0-9]{1,32}/B[A-Z0-9]{1,32}/[A-Za-z0-9]{1,64})re", "<REDACTED_SLACK_WEBHOOK>"},
        {"discord-webhook", R"re(https://discord(?:app)?\.com/api/webhooks/[0-9]{1,32}/[-A-Za-z0-9_]{1,128})re", "<REDACTED_DISCORD_WEBHOOK>"},
        {"generic-webhook-secret", R"re((https?://[^/\s]{1,256}/webhooks?/)[-A-Za-z0-9_]{20,256})re", "$1" + MASK},

        // Cloud providers
        {"gcp-api-key", R"re(AIza[-A-Za-z0-9_]{35})re", MASK},
        {"google-oauth", R"re(ya29\.[-A-Za-z0-9_]{1,512})re", MASK},
        {"azure-storage-key", R"re((AccountKey\s{0,3}=\s{0,3})([A-Za-z0-9+/=]{88}))re", "$1" + MASK, false, true},
        {"azure-connection-string", R"re((DefaultEndpointsProtocol=https?;AccountName=[^;\s]{1,64};AccountKey=)([A-Za-z0-9+/=]{1,128}))re", "$1" + MASK, false, true},
        {"azure-sas-token", R"re(([?&])(sig|sv|ss|srt|sp|se|st|spr|sr)=[^&\s]{1,512})re", "$1$2=" + MASK},
        {"digitalocean-token", R"re(dop_v1_[a-f0-9]{64})re", MASK},
        {"digitalocean-oauth", R"re(doo_v1_[a-f0-9]{64})re", MASK},

        // SaaS API keys
        {"stripe-secret-key", R"re(sk_live_[A-Za-z0-9]{24,255})re", MASK},
        {"stripe-test-key", R"re(sk_test_[A-Za-z0-9]{24,255})re", MASK},
        {"stripe-restricted-key", R"re(rk_live_[A-Za-z0-9]{24,255})re", MASK},
        {"twilio-account-sid", R"re(AC[a-f0-9]{32})re", MASK},
        {"twilio-api-key", R"re(SK[a-f0-9]{32})re", MASK},
        {"sendgrid-api-key", R"re(SG\.[-A-Za-z0-9_]{22}\.[-A-Za-z0-9_]{43})re", MASK},
        {"mailgun-api-key", R"re(key-[a-f0-9]{32})re", MASK},
        {"npm-token", R"re(npm_[A-Za-z0-9]{36,255})re", MASK},
        {"pypi-token", R"re(pypi-[-A-Za-z0-9_]{50,512})re", MASK},
        {"heroku-api-key", R"re((HEROKU_API_KEY\s{0,3}=\s{0,3}['"]?)([-a-f0-9]{36})(['"]?))re", "$1" + MASK + "$3", false, true},
        {"shopify-access-token", R"re(shpat_[a-f0-9]{32})re", MASK},
        {"shopify-shared-secret", R"re(shpss_[a-f0-9]{32})re", MASK},
        {"square-access-token", R"re(sq0atp-[-A-Za-z0-9_]{22})re", MASK},
        {"square-oauth-secret", R"re(sq0csp-[-A-Za-z0-9_]{43})re", MASK},
        {"datadog-api-key", R"re((DD_API_KEY\s{0,3}=\s{0,3}['"]?)([a-f0-9]{32})(['"]?))re", "$1" + MASK + "$3", false, true},
        {"newrelic-api-key", R"re(NRAK-[A-Z0-9]{27})re", MASK},
        {"vault-token", R"re((VAULT_TOKEN\s{0,3}=\s{0,3}['"]?)((?:hv[sbr]|[sbr])\.[-A-Za-z0-9_]{1,256})(['"]?))re", "$1" + MASK + "$3", false, true},
        {"mongodb-connection-string", R"re((mongodb(?:\+srv)?://)[^:\s]{1,256}:([^@\s]{1,512})@)re", "$1[user]:" + MASK + "@"},

        // Generic key=value secrets
        {"generic-secret-assignment",
         R"re(((?:secret|password|passwd|pwd|token|api_key|apikey|auth)[-_]?\w{0,20}\s{0,3}[=:]\s{0,3}['"]?)([^'"\s]{8,512})(['"]?))re",
         "$1" + MASK + "$3", false, true},

        // VAR=value prefixes on a command line
        {"inline-secret-var", R"re((\b(?:PASSWORD|SECRET|TOKEN|API_KEY)\s{0,3}=\s{0,3}['"]?)([^'"\s]{1,512})(['"]?\s))re", "$1" + MASK + "$3"},

        {"curl-password-data",
         R"re((-d\s{1,8}['"]?[^'"]{0,1024}(?:password|passwd|secret|token)['"]{0,2}\s{0,3}[=:]\s{0,3}['"]?)([^'"&\s]{1,512})(['"]?))re",
         "$1" + MASK + "$3"},
        {"docker-secret-env", R"re((-e\s{1,8}[A-Z_]{0,64}(?:PASSWORD|SECRET|TOKEN|API_KEY)[A-Z_]{0,64}=)(\S{1,512}))re", "$1" + MASK},
        {"kubectl-secret", R"re((--from-literal=[-A-Za-z_]{0,64}(?:password|secret|token|key)[-A-Za-z_]{0,64}=)(\S{1,512}))re", "$1" + MASK},
    };
}

std::vector<Pattern> buildPatterns(const std::vector<PatternSpec>& specs) {
    std::vector<Pattern> patterns;
    patterns.reserve(specs.size());
    std::set<std::string> names;

    for (const auto& spec : specs) {
        if (spec.name.empty()) {
            throw std::invalid_argument("pattern with empty name");
        }
        if (!names.insert(spec.name).second) {
            throw std::invalid_argument("duplicate pattern name '" + spec.name + "'");
        }

        auto flags = std::regex::ECMAScript;
        if (spec.ignore_case) {
            flags |= std::regex::icase;
        }

        try {
            patterns.push_back({spec.name, std::regex(spec.matcher, flags), spec.replacement, spec.full_remove});
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("invalid matcher for pattern '" + spec.name + "': " + e.what());
        }
    }

    return patterns;
}

std::vector<Pattern> defaultPatterns() {
    return buildPatterns(defaultPatternSpecs());
}

} // namespace rb
