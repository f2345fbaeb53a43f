#pragma once

#include "openapi_ast.hpp"
#include "result.hpp"
#include "type_registry.hpp"

#include <functional>
#include <optional>
#include <string>

namespace routedoc {

// Maps a composite type to the identifier used in "$ref" strings.
using naming_policy = std::function<result<std::string>(const type_descriptor&)>;

// Uses the descriptor's own name; fails for unnamed descriptors.
naming_policy default_naming_policy();

struct build_config {
    naming_policy naming = default_naming_policy();

    // Optional override consulted before the naming policy. Returning
    // nullopt falls back to the policy.
    std::function<std::optional<std::string>(const type_descriptor&)> model_type_name_handler;

    std::string definition_root = "#/definitions/";
    std::string extension_prefix = "x-";
    std::string tags_metadata_key = "openapi.tags";

    // Invoked on the finished document before build_paths returns it.
    std::function<void(openapi::document&)> post_build_handler;
};

} // namespace routedoc
