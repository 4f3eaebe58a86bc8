#pragma once

#include "infrastructure/EventSerializer.hpp"
#include "projections/ChatReadModelStore.hpp"
#include "projections/IProjector.hpp"

#include <string>

namespace ses::projections {

class ChatProjector : public IProjector {
public:
    explicit ChatProjector(ChatReadModelStore& store);

    const std::string& name() const override { return name_; }
    void project(const ses::domain::StoredEvent& event) override;
    void reset() override;

private:
    ChatReadModelStore& store_;
    ses::infrastructure::EventSerializer serializer_;
    std::string name_{"chat-projector"};
};

} // namespace ses::projections
