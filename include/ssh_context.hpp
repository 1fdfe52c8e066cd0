/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

namespace sigmaxfer {

// Reference-counted global initialization of OpenSSL, libcurl and libssh.
// The last instance to go out of scope releases the libraries.
class SshContext {
   public:
    SshContext();
    ~SshContext();

    SshContext(const SshContext&) = delete;
    SshContext& operator=(const SshContext&) = delete;
};

}  // namespace sigmaxfer
