/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Ferry project.
 */

#pragma once

namespace Ferry {
namespace Core {
namespace Concurrency {

class WorkContractGroup;

/**
 * @brief Callback surface a WorkContractGroup uses to wake whoever executes its work
 *
 * WorkService implements this. A group holds at most one provider at a time; the
 * provider is told when the group goes away so it can drop its reference.
 */
class IConcurrencyProvider {
public:
    virtual ~IConcurrencyProvider() = default;

    virtual void notifyWorkAvailable(WorkContractGroup* group) = 0;
    virtual void notifyGroupDestroyed(WorkContractGroup* group) = 0;
};

} // namespace Concurrency
} // namespace Core
} // namespace Ferry
