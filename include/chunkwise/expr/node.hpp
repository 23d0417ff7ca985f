#pragma once

#include <chunkwise/core/datashape.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chunkwise::expr {

/// Unique identifier for expression nodes. Symbols bind by id, not by name.
using NodeId = std::uint64_t;

class Node;
using ExprPtr = std::shared_ptr<const Node>;

using LiteralValue = std::variant<std::int64_t, double, std::string>;

// ─── Elementwise map bodies ───────────────────────────────────────────────────

struct MapExpr;
using MapExprPtr = std::shared_ptr<const MapExpr>;

/// Reference to a field of the current element. The name "_" refers to the
/// element itself when the input is scalar-typed.
struct ColumnRef {
    std::string name;
};

struct Literal {
    LiteralValue value;
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
};

struct BinaryExpr {
    ArithmeticOp op = ArithmeticOp::Add;
    MapExprPtr left;
    MapExprPtr right;
};

/// Unary math call: abs, neg, sqrt, exp, log.
struct CallExpr {
    std::string callee;
    std::vector<MapExprPtr> args;
};

struct MapExpr {
    std::variant<ColumnRef, Literal, BinaryExpr, CallExpr> node;
};

// ─── Filter predicates ────────────────────────────────────────────────────────

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

struct FilterExpr;
using FilterExprPtr = std::unique_ptr<FilterExpr>;

/// Column reference in a filter expression ("_" for the element itself).
struct FilterColumn {
    std::string name;
};
struct FilterLiteral {
    LiteralValue value;
};
/// Arithmetic on two value expressions.
struct FilterArith {
    ArithmeticOp op;
    FilterExprPtr left, right;
};
/// Comparison between two value expressions; produces a bool.
struct FilterCmp {
    CompareOp op;
    FilterExprPtr left, right;
};
struct FilterAnd {
    FilterExprPtr left, right;
};
struct FilterOr {
    FilterExprPtr left, right;
};
struct FilterNot {
    FilterExprPtr operand;
};
/// Glob match of a string operand against a pattern using `*` and `?`.
struct FilterLike {
    FilterExprPtr operand;
    std::string pattern;
};

struct FilterExpr {
    std::variant<FilterColumn, FilterLiteral, FilterArith, FilterCmp, FilterAnd, FilterOr,
                 FilterNot, FilterLike>
        node;
};

// ─── Grouping ─────────────────────────────────────────────────────────────────

enum class AggFunc : std::uint8_t {
    Sum,
    Mean,
    Min,
    Max,
    Count,
    NUnique,
};

/// Aggregation specification: apply function to column, store as alias.
struct AggSpec {
    AggFunc func = AggFunc::Sum;
    std::string column;
    std::string alias;
};

/// Variance accumulation scheme used by var/std (and their partial states).
enum class VarianceMethod : std::uint8_t {
    /// Per-chunk (n, mean, M2) combined pairwise; stable.
    Welford,
    /// Single pass (Σx² − (Σx)²/n); cancels badly for large, tightly
    /// clustered values.
    SumOfSquares,
};

// ─── Nodes ────────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    Symbol,
    Field,
    Project,
    Relabel,
    Filter,
    Map,
    Head,
    Slice,
    Distinct,
    Sum,
    Count,
    Mean,
    Var,
    Std,
    NUnique,
    Min,
    Max,
    By,
    Partial,
    Finalize,
    GroupFinalize,
};

[[nodiscard]] auto to_string(NodeKind kind) -> std::string;
[[nodiscard]] auto is_reduction(NodeKind kind) noexcept -> bool;

/// Base expression node.
///
/// Nodes are immutable once built and shared between the original
/// expression and the chunk/aggregate expressions derived from it.
class Node {
   public:
    Node(NodeKind kind, NodeId id, DataShape shape, std::vector<ExprPtr> children = {})
        : kind_(kind), id_(id), shape_(std::move(shape)), children_(std::move(children)) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }
    [[nodiscard]] auto id() const noexcept -> NodeId { return id_; }
    /// Declared result schema.
    [[nodiscard]] auto shape() const noexcept -> const DataShape& { return shape_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<ExprPtr>& {
        return children_;
    }
    /// First child; every non-leaf node kind has exactly one.
    [[nodiscard]] auto child() const noexcept -> const ExprPtr& { return children_.front(); }

   private:
    NodeKind kind_;
    NodeId id_;
    DataShape shape_;
    std::vector<ExprPtr> children_;
};

/// Leaf placeholder bound to data at evaluation time.
class SymbolNode final : public Node {
   public:
    SymbolNode(NodeId id, std::string name, DataShape shape)
        : Node(NodeKind::Symbol, id, std::move(shape)), name_(std::move(name)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

   private:
    std::string name_;
};

class FieldNode final : public Node {
   public:
    FieldNode(NodeId id, DataShape shape, ExprPtr child, std::string name)
        : Node(NodeKind::Field, id, std::move(shape), {std::move(child)}),
          name_(std::move(name)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

   private:
    std::string name_;
};

class ProjectNode final : public Node {
   public:
    ProjectNode(NodeId id, DataShape shape, ExprPtr child, std::vector<std::string> columns)
        : Node(NodeKind::Project, id, std::move(shape), {std::move(child)}),
          columns_(std::move(columns)) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<std::string>& {
        return columns_;
    }

   private:
    std::vector<std::string> columns_;
};

/// Rename columns; pairs are (old name, new name).
class RelabelNode final : public Node {
   public:
    using Renames = std::vector<std::pair<std::string, std::string>>;

    RelabelNode(NodeId id, DataShape shape, ExprPtr child, Renames renames)
        : Node(NodeKind::Relabel, id, std::move(shape), {std::move(child)}),
          renames_(std::move(renames)) {}

    [[nodiscard]] auto renames() const noexcept -> const Renames& { return renames_; }

   private:
    Renames renames_;
};

class FilterNode final : public Node {
   public:
    FilterNode(NodeId id, DataShape shape, ExprPtr child,
               std::shared_ptr<const FilterExpr> predicate)
        : Node(NodeKind::Filter, id, std::move(shape), {std::move(child)}),
          predicate_(std::move(predicate)) {}

    [[nodiscard]] auto predicate() const noexcept -> const FilterExpr& { return *predicate_; }
    [[nodiscard]] auto predicate_ptr() const noexcept -> const std::shared_ptr<const FilterExpr>& {
        return predicate_;
    }

   private:
    std::shared_ptr<const FilterExpr> predicate_;
};

/// Elementwise transform producing one scalar per input element.
class MapNode final : public Node {
   public:
    MapNode(NodeId id, DataShape shape, ExprPtr child, MapExprPtr body)
        : Node(NodeKind::Map, id, std::move(shape), {std::move(child)}), body_(std::move(body)) {}

    [[nodiscard]] auto body() const noexcept -> const MapExpr& { return *body_; }
    [[nodiscard]] auto body_ptr() const noexcept -> const MapExprPtr& { return body_; }

   private:
    MapExprPtr body_;
};

class HeadNode final : public Node {
   public:
    HeadNode(NodeId id, DataShape shape, ExprPtr child, std::size_t n)
        : Node(NodeKind::Head, id, std::move(shape), {std::move(child)}), n_(n) {}

    [[nodiscard]] auto n() const noexcept -> std::size_t { return n_; }

   private:
    std::size_t n_;
};

/// Elements [start, stop) of the child.
class SliceNode final : public Node {
   public:
    SliceNode(NodeId id, DataShape shape, ExprPtr child, std::size_t start, std::size_t stop)
        : Node(NodeKind::Slice, id, std::move(shape), {std::move(child)}),
          start_(start),
          stop_(stop) {}

    [[nodiscard]] auto start() const noexcept -> std::size_t { return start_; }
    [[nodiscard]] auto stop() const noexcept -> std::size_t { return stop_; }

   private:
    std::size_t start_;
    std::size_t stop_;
};

class DistinctNode final : public Node {
   public:
    DistinctNode(NodeId id, DataShape shape, ExprPtr child)
        : Node(NodeKind::Distinct, id, std::move(shape), {std::move(child)}) {}
};

/// Sum, Count, Mean, Var, Std, NUnique, Min, Max.
class ReductionNode final : public Node {
   public:
    ReductionNode(NodeKind kind, NodeId id, DataShape shape, ExprPtr child, bool keepdims,
                  bool unbiased = false)
        : Node(kind, id, std::move(shape), {std::move(child)}),
          keepdims_(keepdims),
          unbiased_(unbiased) {}

    /// Present the scalar result as a one-element array.
    [[nodiscard]] auto keepdims() const noexcept -> bool { return keepdims_; }
    /// Divide by n - 1 instead of n (Var and Std only).
    [[nodiscard]] auto unbiased() const noexcept -> bool { return unbiased_; }

   private:
    bool keepdims_;
    bool unbiased_;
};

class ByNode final : public Node {
   public:
    ByNode(NodeId id, DataShape shape, ExprPtr child, std::vector<std::string> keys,
           std::vector<AggSpec> aggregations)
        : Node(NodeKind::By, id, std::move(shape), {std::move(child)}),
          keys_(std::move(keys)),
          aggregations_(std::move(aggregations)) {}

    [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }
    [[nodiscard]] auto aggregations() const noexcept -> const std::vector<AggSpec>& {
        return aggregations_;
    }

   private:
    std::vector<std::string> keys_;
    std::vector<AggSpec> aggregations_;
};

// Column names of partial-state tables.
//   mean:                 sum, count
//   var/std Welford:      count, mean, m2
//   var/std SumOfSquares: count, sum, sumsq
inline constexpr const char* kPartialCount = "count";
inline constexpr const char* kPartialSum = "sum";
inline constexpr const char* kPartialMean = "mean";
inline constexpr const char* kPartialM2 = "m2";
inline constexpr const char* kPartialSumSq = "sumsq";
// Per-group row count kept beside a grouped mean's partial sum, as
// "<alias><suffix>".
inline constexpr const char* kGroupCountSuffix = ".count";

/// Chunk-side half of a two-phase mean/var/std: a one-row table of
/// accumulator state.
class PartialNode final : public Node {
   public:
    PartialNode(NodeId id, DataShape shape, ExprPtr child, NodeKind target,
                VarianceMethod method)
        : Node(NodeKind::Partial, id, std::move(shape), {std::move(child)}),
          target_(target),
          method_(method) {}

    [[nodiscard]] auto target() const noexcept -> NodeKind { return target_; }
    [[nodiscard]] auto method() const noexcept -> VarianceMethod { return method_; }

   private:
    NodeKind target_;
    VarianceMethod method_;
};

/// Aggregate-side half: combines partial-state rows into the final scalar.
class FinalizeNode final : public Node {
   public:
    FinalizeNode(NodeId id, DataShape shape, ExprPtr child, NodeKind target,
                 VarianceMethod method, bool unbiased, bool keepdims)
        : Node(NodeKind::Finalize, id, std::move(shape), {std::move(child)}),
          target_(target),
          method_(method),
          unbiased_(unbiased),
          keepdims_(keepdims) {}

    [[nodiscard]] auto target() const noexcept -> NodeKind { return target_; }
    [[nodiscard]] auto method() const noexcept -> VarianceMethod { return method_; }
    [[nodiscard]] auto unbiased() const noexcept -> bool { return unbiased_; }
    [[nodiscard]] auto keepdims() const noexcept -> bool { return keepdims_; }

   private:
    NodeKind target_;
    VarianceMethod method_;
    bool unbiased_;
    bool keepdims_;
};

/// Aggregate-side completion of a grouped mean split across chunks.
///
/// The child holds, per group, the summed alias column of every mean and its
/// "<alias>.count" row count; this node divides them and drops the counts.
/// Other aggregation columns pass through.
class GroupFinalizeNode final : public Node {
   public:
    GroupFinalizeNode(NodeId id, DataShape shape, ExprPtr child, std::vector<std::string> keys,
                      std::vector<AggSpec> aggregations)
        : Node(NodeKind::GroupFinalize, id, std::move(shape), {std::move(child)}),
          keys_(std::move(keys)),
          aggregations_(std::move(aggregations)) {}

    [[nodiscard]] auto keys() const noexcept -> const std::vector<std::string>& { return keys_; }
    /// The grouping's original aggregations.
    [[nodiscard]] auto aggregations() const noexcept -> const std::vector<AggSpec>& {
        return aggregations_;
    }

   private:
    std::vector<std::string> keys_;
    std::vector<AggSpec> aggregations_;
};

}  // namespace chunkwise::expr
