#include "src/server/token.h"
#include "src/server/crypto.h"
#include "src/server/logger.h"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>

namespace aiexec {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kHeader = R"({"alg":"HS256","typ":"JWT"})";

std::string ToJson(const Struct& message) {
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json);
    if (!status.ok()) {
        Logger::Error("Failed to encode token claims: ", status.ToString());
        return "";
    }
    return json;
}

bool FromJson(const std::string& json, Struct* message) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

const Value* Field(const Struct& message, const char* name) {
    auto it = message.fields().find(name);
    return it == message.fields().end() ? nullptr : &it->second;
}

} // namespace

const char* ToString(TokenError error) {
    switch (error) {
        case TokenError::kMalformed: return "malformed token";
        case TokenError::kUnsupportedAlgorithm: return "unsupported algorithm";
        case TokenError::kBadSignature: return "bad signature";
        case TokenError::kExpired: return "token expired";
        case TokenError::kNotYetValid: return "token not yet valid";
    }
    return "invalid token";
}

int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string TokenSigner::Issue(const SessionClaims& claims) const {
    Struct payload;
    auto& fields = *payload.mutable_fields();
    fields["sub"].set_string_value(claims.subject);
    fields["role"].set_string_value(ToString(claims.role));
    fields["iat"].set_number_value(static_cast<double>(claims.issued_at));
    fields["exp"].set_number_value(static_cast<double>(claims.expires_at));
    fields["su"].set_bool_value(claims.superuser);
    fields["al"].set_bool_value(claims.auto_login);

    std::string signing_input = Base64UrlEncode(kHeader) + "." + Base64UrlEncode(ToJson(payload));
    return signing_input + "." + Base64UrlEncode(HmacSha256(secret_, signing_input));
}

std::variant<SessionClaims, TokenError> TokenSigner::Verify(const std::string& token, int64_t now) const {
    size_t first = token.find('.');
    size_t second = first == std::string::npos ? first : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return TokenError::kMalformed;
    }

    std::string signing_input = token.substr(0, second);
    auto header_json = Base64UrlDecode(token.substr(0, first));
    auto payload_json = Base64UrlDecode(token.substr(first + 1, second - first - 1));
    auto signature = Base64UrlDecode(token.substr(second + 1));
    if (!header_json || !payload_json || !signature) {
        return TokenError::kMalformed;
    }

    Struct header;
    if (!FromJson(*header_json, &header)) {
        return TokenError::kMalformed;
    }
    const Value* alg = Field(header, "alg");
    if (!alg || alg->kind_case() != Value::kStringValue || alg->string_value() != "HS256") {
        return TokenError::kUnsupportedAlgorithm;
    }

    if (!ConstantTimeEquals(HmacSha256(secret_, signing_input), *signature)) {
        return TokenError::kBadSignature;
    }

    Struct payload;
    if (!FromJson(*payload_json, &payload)) {
        return TokenError::kMalformed;
    }

    const Value* sub = Field(payload, "sub");
    const Value* iat = Field(payload, "iat");
    const Value* exp = Field(payload, "exp");
    if (!sub || sub->kind_case() != Value::kStringValue || sub->string_value().empty() ||
        !iat || iat->kind_case() != Value::kNumberValue ||
        !exp || exp->kind_case() != Value::kNumberValue) {
        return TokenError::kMalformed;
    }

    SessionClaims claims;
    claims.subject = sub->string_value();
    claims.issued_at = static_cast<int64_t>(iat->number_value());
    claims.expires_at = static_cast<int64_t>(exp->number_value());

    if (const Value* role = Field(payload, "role")) {
        claims.role = role->string_value() == "superuser" ? Role::kSuperuser : Role::kStandard;
    }
    if (const Value* su = Field(payload, "su")) {
        claims.superuser = su->kind_case() == Value::kBoolValue && su->bool_value();
    }
    if (const Value* al = Field(payload, "al")) {
        claims.auto_login = al->kind_case() == Value::kBoolValue && al->bool_value();
    }

    if (now >= claims.expires_at) {
        return TokenError::kExpired;
    }
    if (claims.issued_at > now + kLeewaySeconds) {
        return TokenError::kNotYetValid;
    }
    return claims;
}

} // namespace aiexec
