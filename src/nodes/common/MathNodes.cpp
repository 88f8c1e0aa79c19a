#include "MathNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"
#include <functional>

namespace flowgraph {
namespace nodes {

// Helper to create math nodes with shared logic
using IntOp = std::function<int64_t(int64_t, int64_t)>;
using DoubleOp = std::function<double(double, double)>;

static bool readOperands(NodeContext& ctx, PinValue& a, PinValue& b) {
    a = ctx.getInput("a");
    b = ctx.getInput("b");

    if (a.isNull() || b.isNull()) {
        ctx.setError(std::string("Input '") + (a.isNull() ? "a" : "b") + "' is not set");
        return false;
    }
    if (!a.isNumeric() || !b.isNumeric()) {
        ctx.setError("Inputs must be numeric");
        return false;
    }
    return true;
}

static void registerMathNode(NodeRegistry& registry, const std::string& name, IntOp intOp, DoubleOp doubleOp) {
    NodeBuilder(name, "math")
        .input("a", Type::Any, int64_t(0))
        .input("b", Type::Any, int64_t(0))
        .output("result", Type::Any)
        .onExecute([intOp, doubleOp](NodeContext& ctx) {
            PinValue a, b;
            if (!readOperands(ctx, a, b)) {
                return;
            }

            if (intOp && a.getType() == Type::Int && b.getType() == Type::Int) {
                ctx.setOutput("result", intOp(a.getInt(), b.getInt()));
            } else {
                ctx.setOutput("result", doubleOp(a.getDouble(), b.getDouble()));
            }
        })
        .buildAndRegister(registry);
}

void registerMathNodes(NodeRegistry& registry) {
    registerMathNode(registry, "add",
        [](int64_t a, int64_t b) { return a + b; },
        [](double a, double b) { return a + b; });

    registerMathNode(registry, "subtract",
        [](int64_t a, int64_t b) { return a - b; },
        [](double a, double b) { return a - b; });

    registerMathNode(registry, "multiply",
        [](int64_t a, int64_t b) { return a * b; },
        [](double a, double b) { return a * b; });

    NodeBuilder("divide", "math")
        .input("a", Type::Any, int64_t(0))
        .input("b", Type::Any, int64_t(1))
        .output("result", Type::Double)
        .onExecute([](NodeContext& ctx) {
            PinValue a, b;
            if (!readOperands(ctx, a, b)) {
                return;
            }
            if (b.getDouble() == 0.0) {
                ctx.setError("Division by zero");
                return;
            }
            ctx.setOutput("result", a.getDouble() / b.getDouble());
        })
        .buildAndRegister(registry);

    NodeBuilder("less_than", "math")
        .input("a", Type::Any, int64_t(0))
        .input("b", Type::Any, int64_t(0))
        .output("result", Type::Bool, false)
        .onExecute([](NodeContext& ctx) {
            PinValue a, b;
            if (!readOperands(ctx, a, b)) {
                return;
            }
            ctx.setOutput("result", a.getDouble() < b.getDouble());
        })
        .buildAndRegister(registry);
}

} // namespace nodes
} // namespace flowgraph
