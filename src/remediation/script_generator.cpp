/**
 * @file script_generator.cpp
 * @brief RemediationGenerator implementation.
 * @author Dimitris Kafetzis
 */

#include "remediation/script_generator.hpp"

#include "graph/dependency_orderer.hpp"
#include "graph/impact.hpp"
#include "graph/property_value.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace cloudslash {

namespace {

constexpr size_t kMaxListedDependents = 5;

const std::unordered_map<std::string_view, std::string_view>& terraform_aliases() {
    static const std::unordered_map<std::string_view, std::string_view> aliases = {
        {"aws_instance",         "AWS::EC2::Instance"},
        {"aws_ebs_volume",       "AWS::EC2::Volume"},
        {"aws_subnet",           "AWS::EC2::Subnet"},
        {"aws_vpc",              "AWS::EC2::VPC"},
        {"aws_nat_gateway",      "AWS::EC2::NatGateway"},
        {"aws_eip",              "AWS::EC2::EIP"},
        {"aws_security_group",   "AWS::EC2::SecurityGroup"},
        {"aws_internet_gateway", "AWS::EC2::InternetGateway"},
        {"aws_db_instance",      "AWS::RDS::DBInstance"},
        {"aws_eks_cluster",      "AWS::EKS::Cluster"},
    };
    return aliases;
}

bool is_arn(std::string_view id) {
    return id.starts_with("arn:");
}

std::string terraform_name(std::string_view resource_id) {
    std::string name = "restore_";
    for (char c : resource_id) {
        name.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 ? c : '_');
    }
    return name;
}

// Node IDs land in `#` comments; a line break would end the comment.
std::string comment_safe(std::string_view text) {
    std::string out{text};
    std::replace_if(out.begin(), out.end(),
                    [](unsigned char c) { return std::iscntrl(c) != 0; }, '?');
    return out;
}

// Terraform string literal body: escapes quotes, backslashes and interpolation.
std::string hcl_escape(std::string_view text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if ((c == '$' || c == '%') && i + 1 < text.size() && text[i + 1] == '{') {
            out.push_back(c);
            out.push_back(c);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string utc_now() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::vector<const Node*> actionable_waste(const GraphState& state) {
    std::vector<const Node*> waste;
    for (const auto& [id, node] : state.nodes) {
        if (node.is_actionable_waste()) waste.push_back(&node);
    }
    std::sort(waste.begin(), waste.end(),
              [](const Node* a, const Node* b) { return a->id < b->id; });
    return waste;
}

std::string join_ids(const std::vector<NodeId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size() && i < kMaxListedDependents; ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    if (ids.size() > kMaxListedDependents) {
        out += std::format(" (+{} more)", ids.size() - kMaxListedDependents);
    }
    return out;
}

Result<void> write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::Io, "cannot open for writing", path.string()};
    }
    file << content;
    file.flush();
    if (!file) {
        return Error{ErrorCode::Io, "write failed", path.string()};
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────
// Free helpers
// ─────────────────────────────────────────────

std::string extract_resource_id(std::string_view id) {
    if (!is_arn(id)) return std::string{id};

    // arn:partition:service:region:account:resource
    size_t pos = 0;
    for (int field = 0; field < 5; ++field) {
        pos = id.find(':', pos);
        if (pos == std::string_view::npos) return std::string{id};
        ++pos;
    }
    std::string_view resource = id.substr(pos);

    size_t cut = resource.find_last_of("/:");
    std::string_view tail = (cut == std::string_view::npos) ? resource : resource.substr(cut + 1);
    return tail.empty() ? std::string{resource} : std::string{tail};
}

std::string shell_quote(std::string_view word) {
    auto is_plain = [](unsigned char c) {
        return std::isalnum(c) != 0 || std::string_view{":/._@+=,-"}.find(static_cast<char>(c)) !=
                                           std::string_view::npos;
    };
    if (!word.empty() && std::all_of(word.begin(), word.end(), is_plain)) {
        return std::string{word};
    }

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string normalize_resource_type(std::string_view type) {
    const auto& aliases = terraform_aliases();
    if (auto it = aliases.find(type); it != aliases.end()) {
        return std::string{it->second};
    }
    return std::string{type};
}

std::optional<std::string> deletion_command(std::string_view type, std::string_view resource_id) {
    const std::string canonical = normalize_resource_type(type);
    const std::string rid = shell_quote(resource_id);

    if (canonical == "AWS::EC2::Instance") {
        return std::format("aws ec2 terminate-instances --instance-ids {}\n"
                           "aws ec2 wait instance-terminated --instance-ids {}",
                           rid, rid);
    }
    if (canonical == "AWS::EC2::Volume") {
        return std::format("aws ec2 create-snapshot --volume-id {} "
                           "--description \"cloudslash pre-delete backup\"\n"
                           "aws ec2 delete-volume --volume-id {}",
                           rid, rid);
    }
    if (canonical == "AWS::EC2::Subnet") {
        return std::format("aws ec2 delete-subnet --subnet-id {}", rid);
    }
    if (canonical == "AWS::EC2::VPC") {
        return std::format("aws ec2 delete-vpc --vpc-id {}", rid);
    }
    if (canonical == "AWS::EC2::NatGateway") {
        return std::format("aws ec2 delete-nat-gateway --nat-gateway-id {}", rid);
    }
    if (canonical == "AWS::EC2::EIP") {
        return std::format("aws ec2 release-address --allocation-id {}", rid);
    }
    if (canonical == "AWS::EC2::SecurityGroup") {
        return std::format("aws ec2 delete-security-group --group-id {}", rid);
    }
    if (canonical == "AWS::EC2::InternetGateway") {
        return std::format("aws ec2 delete-internet-gateway --internet-gateway-id {}", rid);
    }
    if (canonical == "AWS::RDS::DBInstance") {
        return std::format("aws rds stop-db-instance --db-instance-identifier {}", rid);
    }
    return std::nullopt;
}

std::optional<std::string_view> terraform_type(std::string_view type) {
    const std::string canonical = normalize_resource_type(type);
    for (const auto& [tf, cf] : terraform_aliases()) {
        if (cf == canonical) return tf;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// RemediationGenerator
// ─────────────────────────────────────────────

RemediationGenerator::RemediationGenerator(const ResourceGraph& graph, Logger& logger)
    : graph_(graph), logger_(logger) {}

Result<size_t> RemediationGenerator::write_safe_delete_script(std::ostream& out) const {
    std::ostringstream script;
    size_t emitted = 0;

    auto status = graph_.read([&](const GraphState& state) -> Result<void> {
        auto waste = actionable_waste(state);
        std::vector<NodeId> subset;
        subset.reserve(waste.size());
        for (const Node* node : waste) subset.push_back(node->id);

        auto order = DependencyOrderer::topological_sort(state, subset);
        if (!order) return order.error();

        script << "#!/bin/bash\n"
               << "# CloudSlash safe cleanup script\n"
               << "# Generated: " << utc_now() << "\n"
               << "# Resources are removed dependents first.\n\n"
               << "set -e\n\n";

        for (const auto& id : order.value()) {
            const Node* node = state.find(id);
            if (node == nullptr) continue;

            const std::string resource_id = extract_resource_id(id);
            auto command = deletion_command(node->type, resource_id);
            if (!command) {
                script << std::format("# Skipping {}: no cleanup command for type {}\n\n",
                                      comment_safe(id), comment_safe(node->type));
                continue;
            }

            script << std::format("# {} ({}), monthly cost ${:.2f}\n", comment_safe(id),
                                  comment_safe(node->type), node->cost);

            std::vector<NodeId> active_dependents;
            for (const auto& edge : state.in_edges(id)) {
                if (!is_dependency_edge(edge.type)) continue;
                const Node* dependent = state.find(edge.peer);
                if (dependent != nullptr && !dependent->is_waste) {
                    active_dependents.push_back(edge.peer);
                }
            }
            if (!active_dependents.empty()) {
                std::sort(active_dependents.begin(), active_dependents.end());
                script << "# WARNING: still referenced by active resources: "
                       << comment_safe(join_ids(active_dependents)) << "\n";
            }

            if (auto impact = ImpactAnalyzer::analyze_impact(state, id);
                impact && impact->affected_count() > 0) {
                script << std::format("# Blast radius: {} resource(s), {} active, risk {}\n",
                                      impact->affected_count(), impact->active_count,
                                      impact->total_risk_score);
            }

            script << "echo " << shell_quote("Removing " + id) << "\n" << *command << "\n\n";
            ++emitted;
        }

        script << std::format("echo \"Cleanup finished: {} resource(s) processed.\"\n", emitted);
        return {};
    });

    if (!status) {
        logger_.error(std::format("safe cleanup script aborted: {}", status.error().message));
        return status.error();
    }

    out << script.str();
    logger_.info(std::format("safe cleanup script: {} deletion(s)", emitted));
    return emitted;
}

size_t RemediationGenerator::write_ignore_script(std::ostream& out) const {
    size_t tagged = 0;

    graph_.read([&](const GraphState& state) {
        out << "#!/bin/bash\n"
            << "# CloudSlash ignore script\n"
            << "# Generated: " << utc_now() << "\n"
            << "# Tags flagged resources so future scans suppress them.\n\n";

        for (const Node* node : actionable_waste(state)) {
            if (!is_arn(node->id)) {
                out << "# Skipping " << comment_safe(node->id) << ": tagging requires an ARN\n";
                continue;
            }
            out << "aws resourcegroupstaggingapi tag-resources --resource-arn-list "
                << shell_quote(node->id) << " --tags " << kIgnoreTag << "=true\n";
            ++tagged;
        }
    });

    logger_.info(std::format("ignore script: {} resource(s) tagged", tagged));
    return tagged;
}

size_t RemediationGenerator::write_restoration_plan(std::ostream& out, std::string_view region) const {
    size_t imports = 0;

    graph_.read([&](const GraphState& state) {
        out << "# CloudSlash restoration plan (Terraform >= 1.5)\n"
            << "# Generated: " << utc_now() << "\n"
            << "# Run `terraform plan -generate-config-out=restored.tf` to recover\n"
            << "# resources that were removed by safe_cleanup.sh.\n\n"
            << "provider \"aws\" {\n"
            << "  region = \"" << region << "\"\n"
            << "}\n\n";

        for (const Node* node : actionable_waste(state)) {
            auto tf_type = terraform_type(node->type);
            if (!tf_type) continue;

            const std::string resource_id = extract_resource_id(node->id);
            out << "import {\n"
                << "  to = " << *tf_type << "." << terraform_name(resource_id) << "\n"
                << "  id = \"" << hcl_escape(resource_id) << "\"\n"
                << "}\n\n";
            ++imports;
        }
    });

    logger_.info(std::format("restoration plan: {} import block(s)", imports));
    return imports;
}

Result<GeneratedArtifacts> RemediationGenerator::generate_all(const std::filesystem::path& output_dir,
                                                              std::string_view region) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "cannot create output directory: " + ec.message(),
                     output_dir.string()};
    }

    GeneratedArtifacts artifacts;
    artifacts.safe_cleanup_script = output_dir / "safe_cleanup.sh";
    artifacts.ignore_script = output_dir / "ignore_resources.sh";
    artifacts.restoration_plan = output_dir / "restore.tf";

    std::ostringstream cleanup;
    auto deletions = write_safe_delete_script(cleanup);
    if (!deletions) return deletions.error();
    artifacts.deletion_count = deletions.value();

    std::ostringstream ignore;
    write_ignore_script(ignore);

    std::ostringstream restore;
    write_restoration_plan(restore, region);

    for (const auto& [path, content] : {
             std::pair{artifacts.safe_cleanup_script, cleanup.str()},
             std::pair{artifacts.ignore_script, ignore.str()},
             std::pair{artifacts.restoration_plan, restore.str()}}) {
        if (auto written = write_file(path, content); !written) {
            logger_.error(std::format("{}: {}", written.error().subject, written.error().message));
            return written.error();
        }
    }

    for (const auto& script : {artifacts.safe_cleanup_script, artifacts.ignore_script}) {
        std::filesystem::permissions(script,
                                     std::filesystem::perms::owner_exec |
                                         std::filesystem::perms::group_exec,
                                     std::filesystem::perm_options::add, ec);
        if (ec) {
            logger_.warn(std::format("could not mark {} executable: {}", script.string(), ec.message()));
        }
    }

    logger_.info(std::format("remediation artifacts written to {}", output_dir.string()));
    return artifacts;
}

}  // namespace cloudslash
