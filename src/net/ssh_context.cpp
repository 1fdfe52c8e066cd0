/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/ssh_context.hpp"

#include <mutex>
#include <stdexcept>

#include <curl/curl.h>
#include <libssh/libssh.h>
#include <openssl/crypto.h>

namespace sigmaxfer {

namespace {
    std::mutex init_mutex;
    int reference_count = 0;
    bool curl_initialized = false;
    bool ssh_initialized = false;
}

SshContext::SshContext() {
    std::lock_guard<std::mutex> lock(init_mutex);

    if (reference_count == 0) {
        if (OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 0) {
            throw std::runtime_error("Failed to initialize OpenSSL crypto library");
        }

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
            throw std::runtime_error("Failed to initialize libcurl globally");
        }
        curl_initialized = true;

        if (ssh_init() != SSH_OK) {
            curl_global_cleanup();
            curl_initialized = false;
            throw std::runtime_error("Failed to initialize libssh");
        }
        ssh_initialized = true;
    }

    ++reference_count;
}

SshContext::~SshContext() {
    std::lock_guard<std::mutex> lock(init_mutex);

    --reference_count;

    if (reference_count == 0) {
        if (ssh_initialized) {
            ssh_finalize();
            ssh_initialized = false;
        }
        if (curl_initialized) {
            curl_global_cleanup();
            curl_initialized = false;
        }
    }
}

}  // namespace sigmaxfer
