#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../engine/types.hpp"

namespace Trawl {
namespace Storage {

// Persistence of finished jobs. save() throws std::runtime_error when the
// record cannot be written.
class Store {
public:
    virtual ~Store() = default;

    virtual void                             save(const Engine::JobResult& result) = 0;
    virtual std::optional<Engine::JobResult> load(const std::string& id)           = 0;
    virtual bool                             remove(const std::string& id)         = 0;
    virtual std::vector<std::string>         list()                                = 0;
};

}  // namespace Storage
}  // namespace Trawl
