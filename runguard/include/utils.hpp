#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找 uid
 * @throw std::system_error 用户不存在
 */
int get_userid(const std::string &name);

/**
 * @brief 根据用户组名查找 gid
 * @throw std::system_error 用户组不存在
 */
int get_groupid(const std::string &name);
