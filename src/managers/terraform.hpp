#pragma once

#include <string>
#include <filesystem>
#include <core/job.hpp>
#include <core/types.hpp>
#include "command_runner.hpp"

namespace fs = std::filesystem;

// Drives the terraform binary inside a workspace. All calls use the
// workspace as working directory and the job's terraform.tfvars.
class TerraformCli {
public:
    TerraformCli(const CommandRunner& runner, std::string binary, EnvMap env = {});

    void init(const fs::path& workspace, const LineSink& sink) const;
    void apply(const fs::path& workspace, const RetryPolicy& policy, const LineSink& sink) const;
    void destroy(const fs::path& workspace, const RetryPolicy& policy, const LineSink& sink) const;

    // `terraform output -json`, flattened and with derived aliases.
    Result<OutputMap> outputs(const fs::path& workspace) const;

    CommandSpec init_command() const;
    CommandSpec apply_command() const;
    CommandSpec destroy_command() const;
    CommandSpec output_command() const;

private:
    const CommandRunner& runner_;
    std::string binary_;
    EnvMap env_;
};

// Render terraform.tfvars for a job.
std::string render_tfvars(const JobParameters& params, const ResourceNames& names);

// Parse `terraform output -json` into key -> value. Null values are dropped;
// lists and maps are kept as compact JSON text.
Result<OutputMap> parse_terraform_outputs(const std::string& json);

// Fill the endpoint aliases consumers expect when terraform does not emit
// them directly. Existing keys are never overwritten.
void derive_endpoint_aliases(OutputMap& outputs);
