#pragma once

#include <filesystem>

namespace codebox {

/**
 * @brief 用户程序编译及运行的根目录
 * 每个任务在这里创建一个随机命名的工作目录，任务结束后工作目录被删除。
 * 使用容器沙箱时，工作目录会被挂载到容器的 /code。
 *
 * RUN_DIR
 * ├── job-AbC123 // mkdtemp 生成的工作目录
 * │   ├── main.cpp // 用户代码，Java 为 <类名>.java
 * │   ├── main // 编译产物
 * │   ├── stdin.txt // 标准输入
 * │   └── time.txt // /usr/bin/time -v 的输出
 * ├── warm-XyZ789 // 预热使用的工作目录
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后会输出每个子进程的完整命令行
 */
extern bool DEBUG;

}  // namespace codebox
