#ifndef WORKER_GROUP_HPP
#define WORKER_GROUP_HPP

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

/**
 * WorkerGroup - conjunto de threads que sempre são unidas no destrutor.
 *
 * Se a criação de uma thread falhar no meio do caminho, as que já estavam
 * rodando terminam antes da exceção sair do escopo.
 */
class WorkerGroup {
public:
    WorkerGroup() = default;
    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;

    ~WorkerGroup() { joinAll(); }

    void reserve(std::size_t n) { workers.reserve(n); }

    template <typename Fn>
    void spawn(Fn &&fn) {
        workers.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll() {
        for (auto &worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
};

#endif // WORKER_GROUP_HPP
