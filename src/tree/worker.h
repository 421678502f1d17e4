#ifndef WORKER_H
#define WORKER_H

#include "drivetree.pb.h"
#include "status.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class FileTree;

// A background job bound to one node. run() executes on its own thread;
// the outcome is handed back to the tree, which applies it on the owner
// thread through finish().
class Worker : public std::enable_shared_from_this<Worker> {
  public:
    Worker(FileTree *tree, std::string node_uuid, std::string path);
    virtual ~Worker();

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    void start();
    void abort() { aborted_ = true; }
    void join();

    bool aborted() const { return aborted_; }
    bool finished() const { return finished_; }
    const Status &status() const { return status_; }
    const std::string &node_uuid() const { return node_uuid_; }
    const std::string &path() const { return path_; }

    // Owner thread only, after the worker has been posted.
    virtual void finish(FileTree *tree) = 0;

  protected:
    virtual Status run() = 0;

    FileTree *tree_;
    std::string node_uuid_;
    std::string path_;
    std::atomic<bool> aborted_;

  private:
    void main();

    std::atomic<bool> finished_;
    Status status_;
    std::thread thread_;
};

// Lists a directory and reads the record of every entry.
class ProbeWorker : public Worker {
  public:
    using Worker::Worker;

    void finish(FileTree *tree) override;

    const Xstat &self() const { return self_; }
    const std::vector<Xstat> &entries() const { return entries_; }

  protected:
    Status run() override;

  private:
    Xstat self_;
    std::vector<Xstat> entries_;
};

// Fingerprints a file and commits the hash if the file stayed put.
class HashWorker : public Worker {
  public:
    using Worker::Worker;

    void finish(FileTree *tree) override;

    const Xstat &result() const { return result_; }

  protected:
    Status run() override;

  private:
    Xstat result_;
};

#endif // WORKER_H
