#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <sys/types.h>

namespace walletgate::server {

/**
 * @brief Освобождение порта, занятого зависшим процессом
 */
class IPortReclaimer {
public:
    virtual ~IPortReclaimer() = default;

    /// @return true если что-то было остановлено
    virtual bool reclaim(uint16_t port) = 0;
};

/**
 * @brief Поиск владельца порта через /proc и остановка сигналами
 *
 * /proc/net/tcp{,6} даёт inode слушающего сокета, /proc/<pid>/fd
 * даёт процесс. Сначала SIGTERM, после grace SIGKILL.
 * Собственный процесс не трогается никогда.
 */
class ProcPortReclaimer : public IPortReclaimer {
public:
    explicit ProcPortReclaimer(std::chrono::milliseconds grace = std::chrono::milliseconds{1000})
        : grace_(grace) {}

    bool reclaim(uint16_t port) override;

    static std::optional<unsigned long> findListeningInode(uint16_t port);
    static std::optional<pid_t> findOwner(unsigned long inode);

private:
    std::chrono::milliseconds grace_;

    bool terminate(pid_t pid) const;
};

} // namespace walletgate::server
