/**
 * @file script_generator.hpp
 * @brief Remediation artifacts: ordered cleanup script, ignore script, restore plan.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/resource_graph.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cloudslash {

/**
 * @brief Resource ID from an ARN: the last `/`- or `:`-separated token of
 *        its resource part. Non-ARN input is returned unchanged.
 */
[[nodiscard]] std::string extract_resource_id(std::string_view id);

/**
 * @brief Canonical CloudFormation-style type for a resource type tag.
 *        Terraform names (`aws_subnet`) are mapped; others pass through.
 */
[[nodiscard]] std::string normalize_resource_type(std::string_view type);

/**
 * @brief Quote a word for bash. Words made only of `[A-Za-z0-9:/._@+=,-]`
 *        are returned unchanged; anything else is single-quoted.
 */
[[nodiscard]] std::string shell_quote(std::string_view word);

/// Shell command that removes a resource of this type, if one is known.
[[nodiscard]] std::optional<std::string> deletion_command(std::string_view type,
                                                          std::string_view resource_id);

/// Terraform resource type used for import blocks, if supported.
[[nodiscard]] std::optional<std::string_view> terraform_type(std::string_view type);

struct GeneratedArtifacts {
    std::filesystem::path safe_cleanup_script;
    std::filesystem::path ignore_script;
    std::filesystem::path restoration_plan;
    size_t deletion_count = 0;
};

/**
 * @brief Writes remediation artifacts for the waste currently in the graph.
 *
 * Each writer takes one consistent snapshot of the graph. Justified waste is
 * never scheduled for deletion nor re-tagged.
 */
class RemediationGenerator {
public:
    RemediationGenerator(const ResourceGraph& graph, Logger& logger);

    /**
     * @brief Bash script deleting actionable waste, dependents first.
     *
     * Fails with ErrorCode::CycleDetected (and writes nothing) when the waste
     * set cannot be ordered.
     * @return number of deletion commands emitted.
     */
    Result<size_t> write_safe_delete_script(std::ostream& out) const;

    /// Bash script tagging actionable waste ARNs with `cloudslash:ignore=true`.
    size_t write_ignore_script(std::ostream& out) const;

    /// Terraform >= 1.5 import blocks for every supported waste resource.
    size_t write_restoration_plan(std::ostream& out, std::string_view region) const;

    /// Write all three artifacts into `output_dir`.
    Result<GeneratedArtifacts> generate_all(const std::filesystem::path& output_dir,
                                            std::string_view region) const;

private:
    const ResourceGraph& graph_;
    Logger& logger_;
};

}  // namespace cloudslash
