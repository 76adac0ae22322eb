#include "irodori/rejection.hpp"
#include <iomanip>
#include <sstream>

namespace irodori {

namespace {

struct ReasonVisitor {
    RejectReason operator()(const TooDense&) const { return RejectReason::TooDense; }
    RejectReason operator()(const ColorsTooSimilar&) const { return RejectReason::ColorsTooSimilar; }
    RejectReason operator()(const TooManyColors&) const { return RejectReason::TooManyColors; }
    RejectReason operator()(const EmptyCandidate&) const { return RejectReason::InvalidEmpty; }
    RejectReason operator()(const NonUnique&) const { return RejectReason::ValidMultiple; }
    RejectReason operator()(const Timeout&) const { return RejectReason::Timeout; }
    RejectReason operator()(const TooComplex&) const { return RejectReason::TooComplex; }
    RejectReason operator()(const Infeasible&) const { return RejectReason::Infeasible; }
};

struct DescribeVisitor {
    std::ostringstream& oss;

    void operator()(const TooDense& r) const {
        oss << to_string(r.axis) << " " << r.line << " has " << r.run_count
            << " runs (limit " << r.limit << ")";
    }
    void operator()(const ColorsTooSimilar& r) const {
        oss << "colors " << static_cast<int>(r.color_a) << " and " << static_cast<int>(r.color_b)
            << " are " << std::fixed << std::setprecision(1) << r.distance
            << " apart (minimum " << r.minimum << ")";
    }
    void operator()(const TooManyColors& r) const {
        oss << r.count << " colors (limit " << r.limit << ")";
    }
    void operator()(const EmptyCandidate& r) const {
        oss << r.width << "x" << r.height << " grid has no colored cell";
    }
    void operator()(const NonUnique& r) const {
        oss << "second solution after " << r.nodes << " nodes, differs at ("
            << r.row << ", " << r.col << ")";
    }
    void operator()(const Timeout& r) const {
        oss << "gave up after " << std::fixed << std::setprecision(0) << r.elapsed_ms
            << "ms, " << r.nodes << " nodes";
    }
    void operator()(const TooComplex& r) const {
        oss << r.nodes << " nodes reached the limit " << r.limit << " after "
            << std::fixed << std::setprecision(0) << r.elapsed_ms << "ms";
    }
    void operator()(const Infeasible& r) const {
        if (r.during_search) {
            oss << "no solution after " << r.nodes << " nodes";
        } else {
            oss << "contradiction in " << to_string(r.axis) << " " << r.line;
        }
    }
};

}  // namespace

RejectReason reason_of(const Rejection& rejection) {
    return std::visit(ReasonVisitor{}, rejection);
}

const char* to_string(RejectReason reason) {
    switch (reason) {
    case RejectReason::TooDense: return "too_dense";
    case RejectReason::ColorsTooSimilar: return "colors_too_similar";
    case RejectReason::TooManyColors: return "too_many_colors";
    case RejectReason::InvalidEmpty: return "invalid_empty";
    case RejectReason::ValidMultiple: return "valid_multiple";
    case RejectReason::Timeout: return "timeout";
    case RejectReason::TooComplex: return "too_complex";
    case RejectReason::Infeasible: return "infeasible";
    }
    return "unknown";
}

std::string describe(const Rejection& rejection) {
    std::ostringstream oss;
    oss << to_string(reason_of(rejection)) << ": ";
    std::visit(DescribeVisitor{oss}, rejection);
    return oss.str();
}

} // namespace irodori
