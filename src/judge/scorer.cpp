#include "judge/scorer.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "sandbox/workspace.hpp"
#include "worker.hpp"

namespace scorer {
using namespace std;

batch_scorer::batch_scorer(const launcher &runner, const language &lang)
    : runner(runner), lang(lang) {}

batch_result batch_scorer::score(const string &code, const vector<test_case> &test_cases) const {
    submission submit;
    submit.code = code;
    submit.test_cases = test_cases;
    submit.verdicts.resize(test_cases.size());
    submit.faults.resize(test_cases.size());

    concurrent_queue<message::scoring_task> task_queue;
    for (size_t i = 0; i < test_cases.size(); ++i)
        task_queue.push({&submit, i});

    size_t worker_count = test_cases.size();
    if (MAX_PARALLEL > 0) worker_count = min(worker_count, MAX_PARALLEL);

    {
        vector<thread> workers;
        defer {
            for (auto &worker : workers)
                if (worker.joinable()) worker.join();
        };
        for (size_t i = 0; i < worker_count; ++i)
            workers.push_back(start_worker(i, task_queue, *this));
    }

    exception_ptr first_fault;
    for (size_t i = 0; i < submit.faults.size(); ++i) {
        if (!submit.faults[i]) continue;
        if (!first_fault)
            first_fault = submit.faults[i];
        else
            LOG(WARNING) << "Test case " << i << " also failed to be scored";
    }
    if (first_fault) rethrow_exception(first_fault);

    batch_result result;
    for (size_t i = 0; i < submit.verdicts.size(); ++i) {
        if (!submit.verdicts[i])
            throw internal_error("Test case " + to_string(i) + " has not been scored");
        result.verdicts.push_back(move(*submit.verdicts[i]));
    }
    result.all_accepted = all_of(result.verdicts.begin(), result.verdicts.end(), [](const verdict &v) {
        return v.result == outcome::ACCEPTED;
    });
    return result;
}

void batch_scorer::judge(const message::scoring_task &task) const {
    submission &submit = *task.submit;
    try {
        submit.verdicts[task.id] = judge(submit.code, submit.test_cases[task.id]);
        DLOG(INFO) << "Test case " << task.id << ": " << get_display_message(submit.verdicts[task.id]->result);
    } catch (scorer_exception &ex) {
        LOG(ERROR) << "Test case " << task.id << " cannot be scored: " << ex.what() << endl
                   << ex;
        submit.faults[task.id] = current_exception();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Test case " << task.id << " cannot be scored: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        submit.faults[task.id] = current_exception();
    }
}

verdict batch_scorer::judge(const string &code, const test_case &tc) const {
    execution_request request = make_request(code, tc);
    workspace ws = workspace::acquire(request, lang);
    execution_result result = runner.run(ws, request);
    if (auto failed = get_if<exit_status::launch_failed>(&result.status))
        throw launch_error(failed->message);

    verdict v = make_verdict(result, tc.expected_output, lang);
    ws.release();
    return v;
}

}  // namespace scorer
