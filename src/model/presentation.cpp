/**
 * @file presentation.cpp
 * @brief Lookup tables for display names and colors
 */

#include <opsdeck_cpp/presentation.hpp>

namespace opsdeck {

namespace {

constexpr uint32_t kOrange = 0xFFF0883E;
constexpr uint32_t kGreen  = 0xFF3FB950;
constexpr uint32_t kRed    = 0xFFF85149;
constexpr uint32_t kGray   = 0xFF8B949E;
constexpr uint32_t kBlue   = 0xFF58A6FF;
constexpr uint32_t kPurple = 0xFFA371F7;

}  // namespace

DisplayInfo display_info(WorkflowPhase phase) {
    switch (phase) {
        case WorkflowPhase::NEW:           return {"New", kGray};
        case WorkflowPhase::PLANNING:      return {"Planning...", kBlue};
        case WorkflowPhase::PLAN_COMPLETE: return {"Plan Ready", kOrange};
        case WorkflowPhase::IMPLEMENTING:  return {"Implementing...", kBlue};
        case WorkflowPhase::REVIEW:        return {"In Review", kPurple};
        case WorkflowPhase::COMPLETE:      return {"Complete", kGreen};
    }
    return {"New", kGray};
}

DisplayInfo display_info(IssueStatus status) {
    switch (status) {
        case IssueStatus::NEEDS_ACTION: return {"NEEDS ACTION", kOrange};
        case IssueStatus::RUNNING:      return {"RUNNING", kGreen};
        case IssueStatus::FAILED:       return {"FAILED", kRed};
        case IssueStatus::DONE:         return {"DONE", kGray};
    }
    return {"NEEDS ACTION", kOrange};
}

DisplayInfo display_info(JobStatus status) {
    switch (status) {
        case JobStatus::RUNNING:          return {"Running", kGreen};
        case JobStatus::PENDING:          return {"Pending", kGray};
        case JobStatus::COMPLETED:        return {"Completed", kBlue};
        case JobStatus::FAILED:           return {"Failed", kRed};
        case JobStatus::WAITING_APPROVAL: return {"Awaiting Approval", kOrange};
        case JobStatus::REJECTED:         return {"Rejected", kRed};
        case JobStatus::BLOCKED:          return {"Blocked", kOrange};
        case JobStatus::INTERRUPTED:      return {"Interrupted", kOrange};
        case JobStatus::APPROVED_RESUME:  return {"Resuming", kBlue};
        case JobStatus::UNKNOWN:          return {"Unknown", kGray};
    }
    return {"Unknown", kGray};
}

}  // namespace opsdeck
