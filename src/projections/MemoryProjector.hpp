#pragma once

#include "infrastructure/EventSerializer.hpp"
#include "projections/IProjector.hpp"
#include "projections/MemoryReadModelStore.hpp"

#include <string>

namespace ses::projections {

class MemoryProjector : public IProjector {
public:
    explicit MemoryProjector(MemoryReadModelStore& store);

    const std::string& name() const override { return name_; }
    void project(const ses::domain::StoredEvent& event) override;
    void reset() override;

private:
    MemoryReadModelStore& store_;
    ses::infrastructure::EventSerializer serializer_;
    std::string name_{"memory-projector"};
};

} // namespace ses::projections
