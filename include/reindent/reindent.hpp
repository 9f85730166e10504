// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "format/comment_stripper.hpp"
#include "format/dispatcher.hpp"
#include "format/indent_config.hpp"
#include "format/indent_remapper.hpp"
#include "format/json_formatter.hpp"
#include "format/xml_formatter.hpp"
#include "format/xml_writer.hpp"
#include "parsers/json.hpp"
#include "parsers/minimal_toml.hpp"
#include "parsers/xml.hpp"
#include "text/encoding.hpp"
#include "util/filesystem.hpp"
