#pragma once

#include <optional>
#include <string>

namespace finance::ports::output {

/**
 * @brief Интерфейс хранилища "ключ -> blob"
 * 
 * Output Port для низкоуровневого сохранения данных профиля.
 * Содержимое значений хранилищу неизвестно.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /**
     * @brief Прочитать значение
     * 
     * @param key Ключ
     * @return Значение или nullopt, если ключа нет
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Записать значение (с перезаписью)
     * 
     * @throws std::exception при ошибке носителя (переполнение, разрыв соединения)
     */
    virtual void set(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Удалить значение
     * 
     * @return true если ключ существовал
     */
    virtual bool remove(const std::string& key) = 0;
};

} // namespace finance::ports::output
