#pragma once

#include <cstddef>

#include "hindsight/core/model/ids.hpp"
#include "hindsight/core/service/hindsight_service.hpp"

namespace hindsight::core::service {

/**
 * @brief 写入一组演示用 trace，使新启动的中枢有数据可展示
 *
 * 包含普通 HTTP 请求、慢数据库请求、失败请求、多服务嵌套调用、
 * picante 与 rapace 标记的 trace 以及一个仍在进行中的 trace。
 * @return 被接受的跨度数量
 */
std::size_t load_seed_data(HindsightService& service, model::Timestamp now = model::Timestamp::now());

}  // namespace hindsight::core::service
