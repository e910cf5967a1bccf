/*
Purpose: Result normalization and the baseline cache.

What this tests: degraded is set exactly when the chosen backend is not the first
candidate, the advantage ratio is baseline/chosen elapsed when a baseline exists, exactly
1.0 for classical results and uncomputed for zero elapsed time, normalize is a pure
function, and BaselineCache keys on shape and evicts oldest first.
*/

#include "normalizer.hpp"

#include <cassert>

namespace
{
    quboroute::RouteOutcome route_for(const quboroute::ProblemInstance &p, const std::string &chosen, double elapsed)
    {
        quboroute::RouteOutcome r;
        r.outcome.backendId = chosen;
        r.outcome.success = true;
        r.outcome.solution.assign(p.variable_count(), 1.0);
        r.outcome.objectiveValue = p.evaluate(r.outcome.solution);
        r.outcome.elapsedMs = elapsed;
        r.candidates = {"anneal", "anneal-2", "classical"};
        r.attempted = {chosen};
        r.totalElapsedMs = elapsed + 1.0;
        return r;
    }

    bool same(const quboroute::NormalizedResult &a, const quboroute::NormalizedResult &b)
    {
        return a.requestId == b.requestId && a.chosenBackendId == b.chosenBackendId &&
               a.fallbackChainUsed == b.fallbackChainUsed && a.solutionVector == b.solutionVector &&
               a.objectiveValue == b.objectiveValue && a.advantageRatio == b.advantageRatio &&
               a.advantageComputed == b.advantageComputed && a.baselineBackendId == b.baselineBackendId &&
               a.degraded == b.degraded && a.totalElapsedMs == b.totalElapsedMs;
    }
}

int main()
{
    using namespace quboroute;

    auto p = ProblemInstance::create("req-1", 3, {-1, 0.5, 0, 0.5, -1, 0, 0, 0, 2}, "lab");

    // First choice, baseline available.
    {
        RouteOutcome r = route_for(*p, "anneal", 20.0);
        r.baseline = BaselineRun{"classical", 50.0, -1.0};
        const NormalizedResult n = normalize(*p, r);
        assert(n.requestId == "req-1");
        assert(n.chosenBackendId == "anneal");
        assert(!n.degraded);
        assert(n.advantageComputed);
        assert(n.advantageRatio == 2.5);
        assert(n.baselineBackendId == "classical");
        assert(n.fallbackChainUsed == std::vector<BackendId>{"anneal"});
        assert(n.totalElapsedMs == 21.0);
        assert(n.objectiveValue == p->evaluate(n.solutionVector));

        // Same inputs, same output.
        assert(same(n, normalize(*p, r)));
    }

    // Fell back to the second candidate, no baseline.
    {
        RouteOutcome r = route_for(*p, "anneal-2", 10.0);
        r.attempted = {"anneal", "anneal-2"};
        const NormalizedResult n = normalize(*p, r);
        assert(n.degraded);
        assert(!n.advantageComputed);
        assert(n.advantageRatio == 1.0);
        assert(n.baselineBackendId.empty());
        assert(n.fallbackChainUsed.size() == 2);
    }

    // Classical result is its own baseline, even when it was not the first candidate.
    {
        RouteOutcome r = route_for(*p, "classical", 30.0);
        r.chosenKind = BackendKind::ClassicalFallback;
        r.baseline = BaselineRun{"classical", 90.0, 0.0};
        const NormalizedResult n = normalize(*p, r);
        assert(n.degraded);
        assert(n.advantageComputed);
        assert(n.advantageRatio == 1.0);
        assert(n.baselineBackendId == "classical");
    }

    // A zero elapsed time gives no ratio.
    {
        RouteOutcome r = route_for(*p, "anneal", 0.0);
        r.baseline = BaselineRun{"classical", 5.0, 0.0};
        const NormalizedResult n = normalize(*p, r);
        assert(!n.advantageComputed);
        assert(n.advantageRatio == 1.0);
    }

    // Only successes are normalized.
    {
        bool threw = false;
        RouteOutcome r = route_for(*p, "anneal", 1.0);
        r.outcome = SolveOutcome::failure("anneal", ErrorKind::Timeout, 1.0);
        try
        {
            (void)normalize(*p, r);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        RouteOutcome wrongLength = route_for(*p, "anneal", 1.0);
        wrongLength.outcome.solution.pop_back();
        try
        {
            (void)normalize(*p, wrongLength);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    // Shape keys ignore weight values, not the sparsity pattern.
    {
        auto same_shape = ProblemInstance::create("req-2", 3, {-7, 3, 0, 3, -2, 0, 0, 0, 9}, "lab");
        auto other_shape = ProblemInstance::create("req-3", 3, {-7, 0, 0, 0, -2, 0, 0, 0, 9}, "lab");
        auto bigger = ProblemInstance::create("req-4", 4, std::vector<double>(16, 1.0), "lab");
        const ShapeKey k = shape_key(*p);
        assert(!(k < shape_key(*same_shape)) && !(shape_key(*same_shape) < k));
        assert((k < shape_key(*other_shape)) || (shape_key(*other_shape) < k));
        assert(k < shape_key(*bigger));

        BaselineCache cache(2);
        assert(!cache.get(k));
        cache.put(k, BaselineRun{"classical", 4.0, -1.0});
        assert(cache.get(shape_key(*same_shape))->elapsedMs == 4.0);
        cache.put(k, BaselineRun{"classical", 6.0, -1.0});
        assert(cache.size() == 1);
        assert(cache.get(k)->elapsedMs == 6.0);

        cache.put(shape_key(*other_shape), BaselineRun{"classical", 1.0, 0.0});
        cache.put(shape_key(*bigger), BaselineRun{"classical", 2.0, 0.0});
        assert(cache.size() == 2);
        assert(!cache.get(k));
        assert(cache.get(shape_key(*bigger)));

        BaselineCache disabled(0);
        disabled.put(k, BaselineRun{"classical", 1.0, 0.0});
        assert(disabled.size() == 0);
    }

    return 0;
}
