//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_HPP
#define MIME_HPP

#include <mime/error.hpp>
#include <mime/media_type.hpp>
#include <mime/parameter.hpp>
#include <mime/parameter_list.hpp>
#include <mime/parse.hpp>
#include <mime/parser_config.hpp>

#include <mime/rfc/media_type_rule.hpp>
#include <mime/rfc/ows_rule.hpp>
#include <mime/rfc/parameter_rule.hpp>
#include <mime/rfc/quoted_token_rule.hpp>
#include <mime/rfc/quoted_token_view.hpp>
#include <mime/rfc/token_rule.hpp>

#endif
