//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef GRPCFRAME_SRC_COROUTINE_HPP
#define GRPCFRAME_SRC_COROUTINE_HPP

// Stackless coroutines on top of a switch statement.
// The enclosing function must look like:
//   switch (resume_point_) { GRPCFRAME_CORO_INITIAL ...body... }
// No variable with an initializer may be declared in the body's outer scope
// if a resume point follows it, since case labels can't jump over initializations.

#define GRPCFRAME_CORO_INITIAL case 0:

#define GRPCFRAME_YIELD(resume_point_var, resume_point_id, ...) \
    {                                                           \
        resume_point_var = resume_point_id;                     \
        return __VA_ARGS__;                                     \
    }                                                           \
    case resume_point_id:

#endif
