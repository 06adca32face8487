// Copyright (C) 2026 The quizchain developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUIZ_ACCESSCONTROL_HPP
#define QUIZ_ACCESSCONTROL_HPP

#include "error.hpp"
#include "powerlevel.hpp"
#include "storage.hpp"

#include <map>
#include <set>
#include <string>

namespace quiz
{

/**
 * Resolves identities to their power levels and performs the role
 * changes.  Roles are exclusive:  an identity is either an educator,
 * a user or unregistered.
 *
 * Modifications must be done while a transaction on the storage
 * is active.
 */
class AccessControl
{

private:

  /** The storage holding the roles.  */
  QuizStorage& storage;

public:

  explicit AccessControl (QuizStorage& s)
    : storage(s)
  {}

  AccessControl () = delete;
  AccessControl (const AccessControl&) = delete;
  void operator= (const AccessControl&) = delete;

  /**
   * Returns the power level of the given identity.
   */
  PowerLevel GetPowerLevel (const std::string& name) const;

  /**
   * Installs the initial set of educators when the quiz is created.
   * This does not perform any permission checks.
   */
  void Bootstrap (const std::set<std::string>& educators);

  /**
   * Makes the given identity an educator.  This is only allowed if the
   * requester is an educator.  A registered user is promoted, and granting
   * to someone who is already an educator does nothing.
   */
  Error GrantEducator (const std::string& name, const std::string& requester);

  /**
   * Registers the given identity as user.  This is open to everyone and
   * never fails.  It has no effect for users (registering twice is fine)
   * and for educators (who keep their stronger role).
   */
  Error RegisterUser (const std::string& name);

  /**
   * Returns all identities with an explicit role.
   */
  std::map<std::string, PowerLevel> ListRoles () const;

};

} // namespace quiz

#endif // QUIZ_ACCESSCONTROL_HPP
