#include "server/MaintenanceLoop.hpp"

#include <iostream>

namespace walletgate::server {

MaintenanceLoop::MaintenanceLoop(std::chrono::milliseconds interval)
    : interval_(interval)
    , state_(std::make_shared<State>())
{}

MaintenanceLoop::~MaintenanceLoop() {
    stop();
}

void MaintenanceLoop::addTask(const std::string& name, Task task) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    tasks_.push_back(NamedTask{name, task});
    std::lock_guard<std::mutex> stateLock(state_->mutex);
    state_->tasks.push_back(NamedTask{name, std::move(task)});
}

void MaintenanceLoop::start() {
    std::shared_ptr<State> state;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        {
            std::lock_guard<std::mutex> stateLock(state_->mutex);
            if (state_->running) {
                return;
            }
        }
        // Прошлый поток мог остаться отсоединённым и всё ещё держать своё State
        state = std::make_shared<State>();
        state->tasks = tasks_;
        state->running = true;
        state->done = false;
        state_ = state;
    }

    auto interval = interval_;
    thread_ = std::thread([state, interval]() {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (state->running) {
            state->wakeup.wait_for(lock, interval, [&state] { return !state->running; });
            if (!state->running) {
                break;
            }
            lock.unlock();
            runTasks(*state);
            lock.lock();
        }
        state->done = true;
        state->finished.notify_all();
    });

    std::cout << "[MaintenanceLoop] Started (interval " << interval_.count() << " ms)" << std::endl;
}

bool MaintenanceLoop::stop(std::chrono::milliseconds grace) {
    auto state = currentState();
    bool clean = true;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (!state->running) {
            return true;
        }
        state->running = false;
        state->wakeup.notify_all();
        clean = state->finished.wait_for(lock, grace, [&state] { return state->done; });
    }

    if (thread_.joinable()) {
        if (clean) {
            thread_.join();
        } else {
            std::cerr << "[MaintenanceLoop] Task did not finish within "
                      << grace.count() << " ms, detaching" << std::endl;
            thread_.detach();
        }
    }

    std::cout << "[MaintenanceLoop] Stopped" << std::endl;
    return clean;
}

bool MaintenanceLoop::isRunning() const {
    auto state = currentState();
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->running;
}

uint64_t MaintenanceLoop::tickCount() const {
    return currentState()->ticks.load();
}

void MaintenanceLoop::manualTick() {
    runTasks(*currentState());
}

std::shared_ptr<MaintenanceLoop::State> MaintenanceLoop::currentState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

void MaintenanceLoop::runTasks(State& state) {
    std::vector<NamedTask> tasks;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        tasks = state.tasks;
    }

    auto now = domain::Clock::now();
    for (const auto& entry : tasks) {
        try {
            entry.task(now);
        } catch (const std::exception& e) {
            std::cerr << "[MaintenanceLoop] Task '" << entry.name << "' failed: " << e.what() << std::endl;
        }
    }
    ++state.ticks;
}

} // namespace walletgate::server
