// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_TRAINER_H
#define LOCKSTEP_SRC_TRAINING_TRAINER_H

#include <chrono>
#include <cstdint>
#include <vector>

#include "config/training_config.h"
#include "utilities/comm.h"

class IBatchStream;
class IClassifier;
class IReporter;
class ISchedule;
class TrainingRunLogger;

enum class ETrainingPhase {
    Idle,
    EpochStart,
    Training,
    EpochEndTrain,
    Validating,
    EpochEndValid,
    Finished
};

const char* phase_name(ETrainingPhase phase);

//! Position of this worker in the training program.
struct EpochState {
    int EpochIndex = 0;
    long GlobalStep = 0;
};

//! Outcome of one epoch, as seen by this worker.
struct EpochSummary {
    int Epoch = 0;
    double LearningRate = 0.0;
    long TrainSteps = 0;
    double EpochSeconds = 0.0;

    // local training counts of this worker
    std::int64_t TrainCorrect = 0;
    std::int64_t TrainTotal = 0;

    // validation counts summed over all workers
    std::int64_t ValidCorrect = 0;
    std::int64_t ValidTotal = 0;
    double ValidAccuracy = 0.0;
    //! mean over the validation batches of this worker only
    double ValidLoss = 0.0;
};

/**
 * @brief Drives epochs, training steps and validation passes of one worker.
 *
 * Every worker of the process group runs its own TrainingLoop over identical control
 * flow; the collectives it enters (gradient synchronization inside the model's
 * backward(), the validation accuracy reduction) therefore line up across workers.
 * With lockstep checking enabled on the communicator, every worker additionally
 * exchanges its position before each of these collectives.
 *
 * Per epoch:
 *  1. reshard the training data for the epoch
 *  2. set `lr = base_lr * schedule(epoch)` and report `lr`
 *  3. train over all batches, reporting step time, local accuracy and loss
 *  4. report `time-per/epoch`
 *  5. evaluate the full validation set
 *  6. report the world accuracy and the local mean validation loss
 *
 * All collaborators are borrowed and must outlive the loop.
 */
class TrainingLoop {
public:
    TrainingLoop(const TrainingConfig& config, WorkerIdentity identity, Communicator& comm,
                 IBatchStream& train, IBatchStream& valid, IClassifier& model,
                 const ISchedule& schedule, IReporter& reporter, TrainingRunLogger& logger);

    //! Train the remaining epochs; returns one summary per epoch run.
    std::vector<EpochSummary> run();

    //! Train and validate the current epoch, then advance to the next one.
    EpochSummary run_epoch();

    [[nodiscard]] ETrainingPhase phase() const { return mPhase; }
    [[nodiscard]] const EpochState& state() const { return mState; }
    [[nodiscard]] const TrainingConfig& config() const { return mConfig; }
    [[nodiscard]] bool reporting() const { return mReporting; }

private:
    using Clock = std::chrono::steady_clock;

    void train_epoch(EpochSummary& summary);
    void validate_epoch(EpochSummary& summary);

    const TrainingConfig mConfig;
    const WorkerIdentity mIdentity;
    Communicator& mComm;
    IBatchStream& mTrain;
    IBatchStream& mValid;
    IClassifier& mModel;
    const ISchedule& mSchedule;
    IReporter& mReporter;
    TrainingRunLogger& mLogger;
    const bool mReporting;

    ETrainingPhase mPhase = ETrainingPhase::Idle;
    EpochState mState;
    long mStepsPerEpoch = 0;
};

#endif //LOCKSTEP_SRC_TRAINING_TRAINER_H
