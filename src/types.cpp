#include <f1qp/types.hpp>

namespace f1qp {

const char* issue_kind_name(IssueKind k) {
  switch (k) {
    case IssueKind::MissingPriorInput:   return "MissingPriorInput";
    case IssueKind::InsufficientHistory: return "InsufficientHistory";
    case IssueKind::InvalidGroundTruth:  return "InvalidGroundTruth";
    case IssueKind::DegenerateVariance:  return "DegenerateVariance";
  }
  return "Unknown";
}

} // namespace f1qp
