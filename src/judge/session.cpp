#include "judge/session.hpp"
#include <utility>

namespace scorer {
using namespace std;

submission_record make_submission_record(const batch_result &result, scoring_session &&session) {
    scoring_session consumed = move(session);
    submission_record record;
    record.user_id = move(consumed.user_id);
    record.challenge_id = move(consumed.challenge_id);
    record.is_correct = result.all_accepted;
    record.is_public = result.all_accepted;
    if (result.all_accepted)
        record.prompt = move(consumed.prompt);
    return record;
}

}  // namespace scorer
