#include "naming.hpp"
#include <cctype>
#include <random>

std::string sanitize_base(const std::string& base) {
    std::string out;
    for (unsigned char c : base) {
        char lc = static_cast<char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9')) {
            out += lc;
        }
    }
    return out;
}

std::string random_suffix(std::size_t length) {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 25);
    std::string out;
    for (std::size_t i = 0; i < length; ++i) {
        out += static_cast<char>('a' + dist(rng));
    }
    return out;
}

static std::string compose(const std::string& base, std::size_t limit,
                           const std::string& code, const std::string& suffix) {
    std::size_t reserved = code.size() + suffix.size();
    std::size_t room = limit > reserved ? limit - reserved : 0;
    std::string name = base.substr(0, room) + code + suffix;
    return name.substr(0, limit);
}

ResourceNames build_names(const std::string& base, const std::string& suffix) {
    ResourceNames n;
    n.storage_account         = compose(base, 24, "stg", suffix);
    n.search_service          = compose(base, 60, "src", suffix);
    n.ai_services             = compose(base, 40, "ais", suffix);
    n.ai_foundry_hub          = compose(base, 40, "hub", suffix);
    n.app_insights            = compose(base, 40, "appi", suffix);
    n.foundry_project         = compose(base, 30, "prj", suffix);
    n.log_analytics_workspace = compose(base, 40, "law", suffix);
    n.suffix = suffix;
    return n;
}
