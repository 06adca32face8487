// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "storage_tests.hpp"

namespace quiz
{

INSTANTIATE_TYPED_TEST_CASE_P (Memory, BasicQuizStorageTests,
                               MemoryQuizStorage);

} // namespace quiz
