#ifndef EXECUTOR_PACKAGE_MANAGER_HPP
#define EXECUTOR_PACKAGE_MANAGER_HPP
#include <chrono>
#include <string>

namespace executor {

// Installs and removes packages of the interpreter used by executeFile.
class PackageManager {
 public:
  enum class Operation { INSTALL, UNINSTALL };

  // Runs the operation on package. Returns true if the tool ran to
  // completion, whatever its exit status, and sets output to what it
  // printed. Otherwise returns false and sets output to the reason.
  virtual bool Run(Operation operation, const std::string& package,
                   std::string* output) = 0;

  PackageManager() = default;
  virtual ~PackageManager() = default;
  PackageManager(const PackageManager&) = delete;
  PackageManager& operator=(const PackageManager&) = delete;
  PackageManager(PackageManager&&) = delete;
  PackageManager& operator=(PackageManager&&) = delete;
};

// Drives pip, or any tool with the same command line.
class PipPackageManager : public PackageManager {
 public:
  PipPackageManager(std::string tool, std::string temp_directory,
                    std::chrono::seconds timeout)
      : tool_(std::move(tool)),
        temp_directory_(std::move(temp_directory)),
        timeout_(timeout) {}
  ~PipPackageManager() override = default;

  bool Run(Operation operation, const std::string& package,
           std::string* output) override;

 private:
  std::string tool_;
  std::string temp_directory_;
  std::chrono::seconds timeout_;
};

}  // namespace executor

#endif
