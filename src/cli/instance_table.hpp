#pragma once

#include <string>
#include <vector>
#include <managers/fleet_service.hpp>

// Tabular renderings shared by the REPL and the one-shot `ec2ctl list`.
std::string render_instance_table(const std::vector<InstanceSummary>& rows);
std::string render_region_table(const std::vector<Region>& regions,
                                const std::vector<RegionStatus>& status);
