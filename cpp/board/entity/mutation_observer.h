#pragma once

#include <cstdint>

class ElementStore;
class EdgeStore;

// Notified before a record is created, modified or erased so that the prior state can
// be captured. Called once per record per mutation, including cascaded mutations.
class MutationObserver {
public:
    virtual ~MutationObserver() = default;
    virtual void beforeElementChange(const ElementStore& store, std::uint32_t id) = 0;
    virtual void beforeEdgeChange(const EdgeStore& store, std::uint32_t id) = 0;
};
