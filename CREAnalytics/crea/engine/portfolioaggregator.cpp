/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <crea/engine/portfolioaggregator.hpp>
#include <crea/engine/varmessage.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <boost/optional.hpp>
#include <boost/timer/timer.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <thread>

using namespace cre::data;
using namespace QuantLib;
using std::map;
using std::string;
using std::vector;

namespace cre {
namespace analytics {

namespace {

struct PartitionJob {
    string dimension;
    string value;
    vector<Position> positions;
};

Result<Real> evaluate(const PortfolioVarEngine& engine, const PartitionJob& job) {
    Result<Real> r = engine.var(job.positions);
    if (!r.ok()) {
        VarFailureMessage(StructuredMessage::Category::Warning, r.error(), job.dimension, job.value).log();
    }
    return r;
}

} // namespace

PortfolioAggregator::PortfolioAggregator(const QuantLib::ext::shared_ptr<PriceHistory>& prices, VarMethod method,
                                         Real confidence, Size lookbackDays, Size horizonDays, Size nThreads)
    : engine_(prices, method, confidence, lookbackDays, horizonDays), nThreads_(nThreads) {
    QL_REQUIRE(nThreads_ > 0, "PortfolioAggregator: number of threads must be positive");
}

Result<Real> PortfolioAggregator::total(const vector<Position>& positions) const {
    Result<Real> r = engine_.var(positions);
    if (r.ok()) {
        LOG("PortfolioAggregator: total " << engine_.method() << " VaR " << r.value() << " for "
                                          << positions.size() << " positions");
    } else {
        VarFailureMessage(StructuredMessage::Category::Error, r.error(), "Total").log();
    }
    return r;
}

map<string, vector<Position>> PortfolioAggregator::partition(const vector<Position>& positions, BreakdownDimension d) {
    map<string, vector<Position>> result;
    for (const auto& p : positions)
        result[breakdownValue(p, d)].push_back(p);
    return result;
}

VarByLevel PortfolioAggregator::breakdown(const vector<Position>& positions, const vector<string>& dimensions) const {

    boost::timer::cpu_timer timer;

    VarByLevel result;
    vector<string> levels;
    vector<PartitionJob> jobs;

    for (const auto& s : dimensions) {
        BreakdownDimension d;
        if (!tryParseBreakdownDimension(s, d)) {
            RiskError error(RiskError::Kind::UnknownBreakdownColumn,
                            "breakdown dimension '" + s + "' is not a position attribute, skipped");
            VarFailureMessage(StructuredMessage::Category::Warning, error, s).log();
            result.insert(std::make_pair(s, Result<VarByValue>(error)));
            continue;
        }
        string level = to_string(d);
        if (std::find(levels.begin(), levels.end(), level) != levels.end()) {
            WLOG("PortfolioAggregator: breakdown dimension '" << s << "' requested more than once, ignored");
            continue;
        }
        levels.push_back(level);
        if (d == BreakdownDimension::Total) {
            // the whole book is evaluated even if it is empty
            jobs.push_back({level, "Total", positions});
        } else {
            for (auto& kv : partition(positions, d))
                jobs.push_back({level, kv.first, kv.second});
        }
    }

    Size nThreads = std::max<Size>(1, std::min<Size>(nThreads_, jobs.size()));
    LOG("PortfolioAggregator: " << jobs.size() << " partitions over " << levels.size() << " dimensions, "
                                << nThreads << " threads");

    // each job writes to its own slot, so the outcome does not depend on the scheduling
    vector<boost::optional<Result<Real>>> outcomes(jobs.size());

    if (nThreads == 1) {
        for (Size i = 0; i < jobs.size(); ++i)
            outcomes[i] = evaluate(engine_, jobs[i]);
    } else {
        std::vector<std::future<void>> results;
        std::vector<std::thread> workers;
        try {
            for (Size i = 0; i < nThreads; ++i) {
                auto job = [this, &jobs, &outcomes, nThreads](Size id) {
                    DLOG("PortfolioAggregator: start thread " << id);
                    for (Size j = id; j < jobs.size(); j += nThreads)
                        outcomes[j] = evaluate(engine_, jobs[j]);
                    DLOG("PortfolioAggregator: thread " << id << " finished");
                };
                std::packaged_task<void(Size)> task(job);
                results.push_back(task.get_future());
                workers.emplace_back(std::move(task), i);
            }
        } catch (const std::exception& e) {
            // the threads already started still write to outcomes, wait for them before unwinding
            ALOG("PortfolioAggregator: could not start " << nThreads << " threads, " << workers.size()
                                                         << " started: " << e.what());
            for (auto& t : workers)
                t.join();
            throw;
        }
        for (auto& t : workers)
            t.join();
        // rethrows a fatal error raised in a worker
        for (auto& r : results)
            r.get();
    }

    map<string, VarByValue> byLevel;
    for (const auto& l : levels)
        byLevel[l];
    for (Size i = 0; i < jobs.size(); ++i) {
        QL_REQUIRE(outcomes[i], "PortfolioAggregator: internal error, no outcome for partition " << jobs[i].dimension
                                                                                                 << " / " << jobs[i].value);
        byLevel[jobs[i].dimension].insert(std::make_pair(jobs[i].value, *outcomes[i]));
    }
    for (const auto& kv : byLevel)
        result.insert(std::make_pair(kv.first, Result<VarByValue>(kv.second)));

    LOG("PortfolioAggregator: breakdown finished, timings: " << static_cast<double>(timer.elapsed().wall) / 1.0E9
                                                             << "s Wall");
    return result;
}

} // namespace analytics
} // namespace cre
