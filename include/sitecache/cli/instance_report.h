#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/provisioner.h>

namespace sitecache::cli {

/// Site / port / memory / status table; "(none)" when empty
void renderInstanceTable(std::ostream& os, const std::string& title,
                         const std::vector<provision::InstanceStatus>& instances);

nlohmann::json instancesToJson(const std::vector<provision::InstanceStatus>& instances);

/// Connection details, service commands and artifact paths after a successful run
void renderConnectionReport(std::ostream& os, const provision::ProvisionOutcome& outcome,
                            const std::string& host);

} // namespace sitecache::cli
