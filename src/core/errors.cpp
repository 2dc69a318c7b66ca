#include "assetforge/core/errors.hpp"

namespace assetforge::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Duplicate: return "Duplicate";
            case StatusCode::Conflict: return "Conflict";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Migration: return "Migration";
            case StatusCode::Unsupported: return "Unsupported";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Catalog: return "Catalog";
            case StatusDomain::Identity: return "Identity";
            case StatusDomain::Items: return "Items";
            case StatusDomain::Audit: return "Audit";
            case StatusDomain::Migration: return "Migration";
            case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }
} // namespace assetforge::core
