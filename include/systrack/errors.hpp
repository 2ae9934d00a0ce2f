/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace systrack {

class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Host metrics could not be read. No partial snapshot is ever returned.
class CollectionError : public Error {
   public:
    using Error::Error;
};

// The ping utility is missing from the host. Unlike an unreachable target
// this aborts the request.
class ProbeUnavailable : public Error {
   public:
    using Error::Error;
};

class PersistenceError : public Error {
   public:
    using Error::Error;
};

class Interrupted : public Error {
   public:
    Interrupted() : Error("Operation cancelled by user.") {}
};

}  // namespace systrack
