#pragma once

#include "gateway/types.hpp"

// Transmits one order to the exchange and returns its verdict. Called from the
// dispatcher tick thread and from client threads on the immediate-send path.
class Sender {
public:
    virtual ~Sender() = default;

    virtual SendReceipt send(const Order& order) = 0;
};
