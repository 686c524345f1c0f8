/**
 * @file presentation.hpp
 * @brief Display names and colors for domain enums
 *
 * Kept apart from types.hpp so the sync core stays free of UI concerns.
 * Colors are 0xAARRGGBB.
 */

#pragma once

#include <opsdeck_cpp/types.hpp>
#include <cstdint>
#include <string>

namespace opsdeck {

struct DisplayInfo {
    std::string label;
    uint32_t argb;
};

DisplayInfo display_info(WorkflowPhase phase);
DisplayInfo display_info(IssueStatus status);
DisplayInfo display_info(JobStatus status);

}  // namespace opsdeck
