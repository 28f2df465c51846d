// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <compview/strings/tstring.hpp>

namespace compview {
namespace os {

/**
 * Set the environment variable with name key to value for the duration of current process.
 *
 * Will throw a runtime error if it failed to set the environment variable.
 */
void set_environment_variable( const compview::tstring& key, const compview::tstring& value );

/**
 * Remove the environment variable with name key from the current process. Removing a variable that is not set is
 * not an error.
 */
void unset_environment_variable( const compview::tstring& key );

/**
 * @return the value stored in the environment variable if it's set, an empty string otherwise
 */
compview::tstring get_environment_variable( const compview::tstring& key );

} // namespace os
} // namespace compview
