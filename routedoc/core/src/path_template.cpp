#include "routedoc/core/path_template.hpp"

namespace routedoc {

sanitized_path sanitize_path(std::string_view raw_path) {
    sanitized_path out;
    out.path.reserve(raw_path.size());

    size_t pos = 0;
    while (pos <= raw_path.size()) {
        size_t next = raw_path.find('/', pos);
        if (next == std::string_view::npos) {
            next = raw_path.size();
        }
        std::string_view fragment = raw_path.substr(pos, next - pos);
        pos = next + 1;
        if (fragment.empty()) {
            continue;
        }

        out.path.push_back('/');
        size_t colon = fragment.find(':');
        if (fragment.front() != '{' || colon == std::string_view::npos) {
            out.path.append(fragment);
            continue;
        }

        std::string_view name = fragment.substr(1, colon - 1);
        std::string_view pattern = fragment.substr(colon + 1);
        if (!pattern.empty() && pattern.back() == '}') {
            pattern.remove_suffix(1);
        }
        out.patterns.insert_or_assign(std::string(name), std::string(pattern));
        out.path.push_back('{');
        out.path.append(name);
        out.path.push_back('}');
    }
    return out;
}

std::string_view pattern_for(const pattern_map& patterns, std::string_view name) noexcept {
    auto it = patterns.find(name);
    if (it == patterns.end()) {
        return {};
    }
    return it->second;
}

std::string strip_tags(std::string_view html) {
    std::string text;
    text.reserve(html.size());
    size_t pos = 0;
    while (pos < html.size()) {
        size_t open = html.find('<', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t close = html.find('>', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        text.append(html.substr(pos, open - pos));
        pos = close + 1;
    }
    text.append(html.substr(pos));
    return text;
}

} // namespace routedoc
