#pragma once

#include "domain/Timestamp.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace walletgate::server {

/**
 * @brief Фоновая периодическая чистка
 *
 * Один поток выполняет все зарегистрированные задачи раз в interval.
 * stop() будит поток и ждёт его не дольше grace. Если задача
 * зависла, поток отсоединяется: остановка процесса не блокируется.
 *
 * Каждый start() заводит свежее State, поэтому отсоединённый поток
 * прошлого запуска не делит флаги и счётчик с новым.
 */
class MaintenanceLoop {
public:
    using Task = std::function<void(domain::TimePoint)>;

    explicit MaintenanceLoop(std::chrono::milliseconds interval);
    ~MaintenanceLoop();

    MaintenanceLoop(const MaintenanceLoop&) = delete;
    MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;

    /// Добавлять задачи можно только до start()
    void addTask(const std::string& name, Task task);

    void start();

    /**
     * @return true если поток завершился в пределах grace
     */
    bool stop(std::chrono::milliseconds grace = std::chrono::milliseconds{2000});

    bool isRunning() const;
    uint64_t tickCount() const;

    /// Выполнить все задачи сейчас (для тестов)
    void manualTick();

private:
    struct NamedTask {
        std::string name;
        Task task;
    };

    /// Состояние одного запуска, живёт дольше объекта, если поток пришлось отсоединить
    struct State {
        std::mutex mutex;
        std::condition_variable wakeup;
        std::condition_variable finished;
        bool running = false;
        bool done = true;
        std::atomic<uint64_t> ticks{0};
        std::vector<NamedTask> tasks;
    };

    static void runTasks(State& state);

    std::shared_ptr<State> currentState() const;

    std::chrono::milliseconds interval_;

    mutable std::mutex stateMutex_;
    std::vector<NamedTask> tasks_;
    std::shared_ptr<State> state_;
    std::thread thread_;
};

} // namespace walletgate::server
