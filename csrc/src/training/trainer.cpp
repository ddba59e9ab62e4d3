// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "trainer.h"

#include <stdexcept>

#include <fmt/core.h>

#include "classifier.h"
#include "data.h"
#include "logging.h"
#include "metrics.h"
#include "reporter.h"
#include "schedule.h"
#include "utilities/utils.h"

namespace {

template<typename Duration>
int to_milliseconds(Duration duration) {
    return narrow<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

template<typename Duration>
double to_seconds(Duration duration) {
    return std::chrono::duration<double>(duration).count();
}

} // namespace

const char* phase_name(ETrainingPhase phase) {
    switch (phase) {
        case ETrainingPhase::Idle: return "idle";
        case ETrainingPhase::EpochStart: return "epoch-start";
        case ETrainingPhase::Training: return "training";
        case ETrainingPhase::EpochEndTrain: return "epoch-end-train";
        case ETrainingPhase::Validating: return "validating";
        case ETrainingPhase::EpochEndValid: return "epoch-end-valid";
        case ETrainingPhase::Finished: return "finished";
    }
    throw std::logic_error("Unknown training phase");
}

TrainingLoop::TrainingLoop(const TrainingConfig& config, WorkerIdentity identity, Communicator& comm,
                           IBatchStream& train, IBatchStream& valid, IClassifier& model,
                           const ISchedule& schedule, IReporter& reporter, TrainingRunLogger& logger) :
    mConfig(config), mIdentity(identity), mComm(comm), mTrain(train), mValid(valid), mModel(model),
    mSchedule(schedule), mReporter(reporter), mLogger(logger), mReporting(reporter.active())
{
    if (mIdentity.Rank != mComm.rank() || mIdentity.WorldSize != mComm.world_size()) {
        throw std::invalid_argument(fmt::format("TrainingLoop: worker {}/{} does not match communicator {}/{}",
                                                mIdentity.Rank, mIdentity.WorldSize, mComm.rank(), mComm.world_size()));
    }
    if (mConfig.ReportEvery <= 0) {
        throw std::invalid_argument(fmt::format("TrainingLoop: report interval must be positive, got {}", mConfig.ReportEvery));
    }
}

std::vector<EpochSummary> TrainingLoop::run() {
    std::vector<EpochSummary> summaries;
    while (mState.EpochIndex < mConfig.EpochCount) {
        summaries.push_back(run_epoch());
    }
    mPhase = ETrainingPhase::Finished;
    return summaries;
}

EpochSummary TrainingLoop::run_epoch() {
    if (mState.EpochIndex >= mConfig.EpochCount) {
        throw std::logic_error(fmt::format("TrainingLoop: all {} epochs have already been run", mConfig.EpochCount));
    }

    const int epoch = mState.EpochIndex;
    mPhase = ETrainingPhase::EpochStart;
    const auto epoch_start = Clock::now();

    EpochSummary summary;
    summary.Epoch = epoch;

    mTrain.reshard(epoch);
    mStepsPerEpoch = static_cast<long>(mTrain.num_batches());

    summary.LearningRate = mConfig.BaseLearningRate * mSchedule.eval_precise(epoch);
    mModel.set_learning_rate(summary.LearningRate);
    if (mReporting) {
        mReporter.report("lr", summary.LearningRate, report_step(epoch, 0, mStepsPerEpoch));
    }

    mPhase = ETrainingPhase::Training;
    train_epoch(summary);

    mPhase = ETrainingPhase::EpochEndTrain;
    summary.EpochSeconds = to_seconds(Clock::now() - epoch_start);
    if (mReporting) {
        mReporter.report("time-per/epoch", summary.EpochSeconds, report_step(epoch + 1, 0, mStepsPerEpoch));
    }

    mPhase = ETrainingPhase::Validating;
    validate_epoch(summary);

    mPhase = ETrainingPhase::EpochEndValid;
    if (mReporting) {
        const long at = report_step(epoch + 1, 0, mStepsPerEpoch);
        mReporter.report("accuracy/valid", summary.ValidAccuracy, at);
        mReporter.report("loss/valid", summary.ValidLoss, at);
    }

    ++mState.EpochIndex;
    return summary;
}

void TrainingLoop::train_epoch(EpochSummary& summary) {
    const int epoch = mState.EpochIndex;
    int step = 0;
    while (auto batch = mTrain.next_batch()) {
        const auto step_start = Clock::now();

        auto scores = mModel.forward(*batch);
        const double loss = mModel.cross_entropy();
        const CorrectTotal counts = count_correct(scores, batch->Labels, mModel.num_classes());

        mComm.check_lockstep(LockstepTag{.Epoch = epoch, .Step = step, .Op = ECollective::GradientSync});
        mModel.backward();
        mModel.step();
        mModel.zero_grad();

        const auto step_time = Clock::now() - step_start;
        summary.TrainCorrect += counts.Correct;
        summary.TrainTotal += counts.Total;

        // local view of this worker only
        const double train_accuracy = accuracy(counts);
        const long at = report_step(epoch, step, mStepsPerEpoch);
        mLogger.log_step(epoch, step, at, to_milliseconds(step_time), static_cast<float>(loss),
                         static_cast<float>(train_accuracy), static_cast<float>(summary.LearningRate));
        if (mReporting && step % mConfig.ReportEvery == 0) {
            mReporter.report("time-per/step", to_seconds(step_time), at);
            mReporter.report("accuracy/train", train_accuracy, at);
            mReporter.report("loss/train", loss, at);
        }

        ++step;
        ++mState.GlobalStep;
    }
    summary.TrainSteps = step;
}

/**
 * Every worker evaluates the complete validation set. The correct/total counts are then
 * summed over all workers, while the loss stays the mean over this worker's batches.
 */
void TrainingLoop::validate_epoch(EpochSummary& summary) {
    const int epoch = mState.EpochIndex;
    const auto start = Clock::now();

    mValid.reshard(epoch);
    CorrectTotal local;
    std::vector<double> losses;
    while (auto batch = mValid.next_batch()) {
        auto scores = mModel.forward(*batch);
        losses.push_back(mModel.cross_entropy());
        local += count_correct(scores, batch->Labels, mModel.num_classes());
    }

    MetricReducer reducer(mComm);
    mComm.check_lockstep(LockstepTag{.Epoch = epoch, .Step = 0, .Op = ECollective::MetricReduce});
    const CorrectTotal world = reducer.world_counts(local);
    summary.ValidCorrect = world.Correct;
    summary.ValidTotal = world.Total;
    summary.ValidAccuracy = accuracy(world);
    summary.ValidLoss = MetricReducer::local_average(losses);

    mLogger.log_eval(epoch, report_step(epoch + 1, 0, mStepsPerEpoch), to_milliseconds(Clock::now() - start),
                     static_cast<float>(summary.ValidLoss), static_cast<float>(summary.ValidAccuracy));
}
