// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/unit_descriptor.hpp>
#include <reel/core/url.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <filesystem>
#include <functional>
#include <stdexcept>

namespace reel::core {

namespace {

std::string normalize_target(std::string_view target_path) {
    std::error_code ec;
    std::filesystem::path p{std::string(target_path)};
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) {
        return p.lexically_normal().string();
    }
    return abs.lexically_normal().string();
}

} // namespace

std::string make_unit_id(std::string_view target_path) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(target_path.data(), target_path.size(), digest, &len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += HEX[digest[i] >> 4];
        hex += HEX[digest[i] & 0x0F];
    }
    return hex;
}

std::expected<UnitDescriptor, std::error_code>
UnitDescriptor::make(std::string_view url, std::string_view target_path,
                     std::string_view item_id, std::string_view track_ref) noexcept {
    auto parsed = Url::parse(url);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!parsed->is_http()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }
    if (target_path.empty()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    try {
        UnitDescriptor d;
        d.url = std::string(url);
        d.target_path = normalize_target(target_path);
        d.id = make_unit_id(d.target_path);
        d.item_id = std::string(item_id);
        d.track_ref = std::string(track_ref);
        return d;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }
}

std::string UnitDescriptor::serialize() const {
    nlohmann::json j = *this;
    return j.dump();
}

std::expected<UnitDescriptor, std::error_code>
UnitDescriptor::deserialize(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        return j.get<UnitDescriptor>();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }
}

std::size_t UnitDescriptorHash::operator()(const UnitDescriptor& d) const noexcept {
    std::size_t code = 17;
    code = 31 * code + std::hash<std::string>{}(d.url);
    code = 31 * code + std::hash<std::string>{}(d.target_path);
    return code;
}

void to_json(nlohmann::json& j, const UnitDescriptor& d) {
    j = nlohmann::json{
        {"id", d.id},
        {"url", d.url},
        {"targetFile", d.target_path},
        {"itemId", d.item_id},
        {"trackRelativeId", d.track_ref},
    };
}

void from_json(const nlohmann::json& j, UnitDescriptor& d) {
    auto made = UnitDescriptor::make(j.at("url").get<std::string>(),
                                     j.at("targetFile").get<std::string>(),
                                     j.value("itemId", std::string{}),
                                     j.value("trackRelativeId", std::string{}));
    if (!made) {
        throw std::invalid_argument("invalid unit descriptor: " + made.error().message());
    }
    // The stored id is ignored; it is always derived from the target path.
    d = std::move(*made);
}

} // namespace reel::core
