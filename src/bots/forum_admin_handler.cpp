#include "../../include/bots/forum_admin_handler.hpp"
#include "../../include/config/app_config.hpp"
#include "../../include/services/admin_directory.hpp"
#include "../../include/services/backup_manager.hpp"
#include "../../include/services/post_manager.hpp"
#include "../../include/services/post_type_manager.hpp"
#include "../../include/state/state_store.hpp"
#include "../../include/telegram/chat_transport.hpp"
#include "../../include/telegram/entities.hpp"
#include "../../include/utils/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace forumbot {

namespace {

const char* kStateSaveError = "❌ Ошибка сохранения состояния";
const char* kWrongStepError = "❌ Ошибка: неверное состояние";
const char* kTypeLookupError = "❌ Ошибка получения типа поста";
const char* kBadLinkError = "❌ Неверный формат ссылки или пост не был создан этим ботом";
const char* kForumNotConfigured = "❌ Целевая группа не настроена. Укажите её в настройках доступа.";
const char* kImagePrompt = "Отправьте изображение для типа поста или нажмите \"Пропустить\" "
                           "если изображение не требуется.";

InlineKeyboard cancelKeyboard() {
    return {{{"❌ Отмена", "cancel"}}};
}

InlineKeyboard imagePromptKeyboard() {
    return {
        {{"⏭ Пропустить", "skip_image"}},
        {{"❌ Отмена", "cancel"}},
    };
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// "/new@my_bot extra" -> "/new"
std::string commandName(const std::string& text) {
    std::string cmd = text.substr(0, text.find_first_of(" \n"));
    const auto at = cmd.find('@');
    if (at != std::string::npos) {
        cmd.erase(at);
    }
    return cmd;
}

bool parseInt(const std::string& raw, int64_t& out) {
    const std::string digits = trim(raw);
    if (digits.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(digits.c_str(), &end, 10);
    if (errno != 0 || end != digits.c_str() + digits.size()) {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

bool parsePrefixedId(const std::string& data, const std::string& prefix, int64_t& id) {
    if (data.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (!parseInt(data.substr(prefix.size()), id)) {
        Logger::getInstance().warning("Bad id in callback data: " + data);
        return false;
    }
    return true;
}

std::string describeIds(const std::vector<int64_t>& ids) {
    if (ids.empty()) {
        return "не настроены";
    }
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) oss << ", ";
        oss << ids[i];
    }
    return oss.str();
}

std::string describeId(int64_t id) {
    return id == 0 ? "не настроен" : std::to_string(id);
}

InlineKeyboard typeOptionsKeyboard(const PostType& type) {
    const std::string id = std::to_string(type.id);
    return {
        {{"📝 Изменить название", "edit_type_name:" + id}},
        {{"✨ Заменить эмодзи", "edit_type_emoji:" + id}},
        {{"🖼 Заменить изображение", "edit_type_image:" + id}},
        {{"📄 Заменить шаблон", "edit_type_template:" + id}},
        {{type.is_active ? "🔴 Отключить" : "🟢 Включить", "toggle_type_active:" + id}},
        {{"← Назад", "settings_manage_types"}},
    };
}

struct TypeEditCallback {
    const char* prefix;
    ConversationStep step;
};

const TypeEditCallback kTypeEditCallbacks[] = {
    {"edit_type_name:", ConversationStep::EditTypeName},
    {"edit_type_emoji:", ConversationStep::EditTypeEmoji},
    {"edit_type_image:", ConversationStep::EditTypeImage},
    {"edit_type_template:", ConversationStep::EditTypeTemplate},
};

} // namespace

const char* handleResultName(HandleResult result) {
    switch (result) {
        case HandleResult::Ignored: return "ignored";
        case HandleResult::Unhandled: return "unhandled";
        case HandleResult::Advanced: return "advanced";
        case HandleResult::Rejected: return "rejected";
        case HandleResult::Committed: return "committed";
        case HandleResult::Cancelled: return "cancelled";
        case HandleResult::Failed: return "failed";
    }
    return "unknown";
}

ForumAdminHandler::ForumAdminHandler(ChatTransport& transport, AdminDirectory& admins, StateStore& states,
                                     PostManager& posts, PostTypeManager& types, BackupManager& backups)
    : transport_(transport), admins_(admins), states_(states), posts_(posts), types_(types), backups_(backups) {
}

HandleResult ForumAdminHandler::handleUpdate(const Update& update) {
    const int64_t sender = update.senderId();
    if (sender == 0 || !admins_.isAdmin(sender)) {
        Logger::getInstance().debug("Ignoring update " + std::to_string(update.update_id) +
                                    " from non-admin " + std::to_string(sender));
        return HandleResult::Ignored;
    }

    HandleResult result = HandleResult::Unhandled;
    int64_t chat_id = 0;
    try {
        if (update.message) {
            chat_id = update.message->chat_id;
            if (update.message->isCommand()) {
                result = dispatchCommand(*update.message);
            }
            if (result == HandleResult::Unhandled) {
                result = dispatchMessage(*update.message);
            }
        } else if (update.callback) {
            chat_id = update.callback->chat_id;
            result = dispatchCallback(*update.callback);
        }
    } catch (const StateIntegrityError& e) {
        Logger::getInstance().error(e.what());
        if (chat_id != 0) {
            say(chat_id, "❌ Состояние диалога повреждено. Отправьте /cancel, чтобы начать заново.");
        }
        return HandleResult::Failed;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Update " + std::to_string(update.update_id) + " from admin " +
                                    std::to_string(sender) + " failed: " + e.what());
        if (chat_id != 0) {
            say(chat_id, "❌ Внутренняя ошибка, попробуйте ещё раз");
        }
        return HandleResult::Failed;
    }

    Logger::getInstance().debug("Update " + std::to_string(update.update_id) + " from admin " +
                                std::to_string(sender) + ": " + handleResultName(result));
    return result;
}

HandleResult ForumAdminHandler::dispatchCommand(const Message& msg) {
    const std::string cmd = commandName(msg.text);
    const int64_t admin = msg.from_id;
    const int64_t chat = msg.chat_id;

    if (cmd == "/start" || cmd == "/admin") return showAdminMenu(chat, 0);
    if (cmd == "/new") return startNewPost(admin, chat, 0);
    if (cmd == "/edit") return startLinkWorkflow(admin, chat, 0, ConversationStep::EditPostEnterLink);
    if (cmd == "/delete") return startLinkWorkflow(admin, chat, 0, ConversationStep::DeletePostEnterLink);
    if (cmd == "/reply") return startLinkWorkflow(admin, chat, 0, ConversationStep::ReplyEnterLink);
    if (cmd == "/cancel") return cancel(admin, chat, 0);
    if (cmd == "/backup") return backup(chat, 0);
    return HandleResult::Unhandled;
}

HandleResult ForumAdminHandler::dispatchMessage(const Message& msg) {
    auto state = loadState(msg.from_id);
    if (!state || state->isIdle()) {
        return HandleResult::Unhandled;
    }

    switch (*state->step) {
        case ConversationStep::NewPostEnterText: return enterPostText(msg, *state);
        case ConversationStep::EditPostEnterLink: return enterEditLink(msg, *state);
        case ConversationStep::EditPostEnterText: return enterEditText(msg, *state);
        case ConversationStep::DeletePostEnterLink: return enterDeleteLink(msg, *state);
        case ConversationStep::NewTypeEnterName: return enterTypeName(msg, *state);
        case ConversationStep::NewTypeEnterEmoji: return enterTypeEmoji(msg, *state);
        case ConversationStep::NewTypeEnterImage: return enterTypeImage(msg, *state);
        case ConversationStep::NewTypeEnterTemplate: return enterTypeTemplate(msg, *state);
        case ConversationStep::EditTypeName:
        case ConversationStep::EditTypeEmoji:
        case ConversationStep::EditTypeImage:
        case ConversationStep::EditTypeTemplate: return enterTypeEdit(msg, *state);
        case ConversationStep::EditAdminIds: return enterAdminIds(msg, *state);
        case ConversationStep::EditForumId:
        case ConversationStep::EditTopicId: return enterForumOrTopicId(msg, *state);
        case ConversationStep::ReplyEnterLink: return enterReplyLink(msg, *state);
        case ConversationStep::ReplyEnterText: return enterReplyText(msg, *state);
        case ConversationStep::NewPostSelectType:
        case ConversationStep::NewPostConfirm:
        case ConversationStep::ManageTypes:
        case ConversationStep::ReplyConfirm:
            // These steps wait for a button.
            say(msg.chat_id, "❌ Используйте кнопки выше или отправьте /cancel для отмены");
            return HandleResult::Rejected;
    }
    return HandleResult::Unhandled;
}

HandleResult ForumAdminHandler::dispatchCallback(const CallbackQuery& query) {
    SendResult ack = transport_.answerCallbackQuery(query.id, "");
    if (!ack.ok) {
        Logger::getInstance().debug("Callback " + query.id + " not acknowledged: " + ack.error);
    }
    if (query.chat_id == 0) {
        return HandleResult::Unhandled;
    }

    const std::string& data = query.data;
    const int64_t admin = query.from_id;
    const int64_t chat = query.chat_id;
    const int64_t mid = query.message_id;

    if (data == "cancel") return cancel(admin, chat, mid);
    if (data == "confirm_post") return confirmPost(admin, chat, mid);
    if (data == "confirm_reply") return confirmReply(admin, chat, mid);
    if (data == "skip_emoji") return skipTypeEmoji(admin, chat, mid);
    if (data == "skip_image") return skipTypeImage(admin, chat, mid);
    if (data == "admin_new_post") return startNewPost(admin, chat, mid);
    if (data == "admin_edit_post") return startLinkWorkflow(admin, chat, mid, ConversationStep::EditPostEnterLink);
    if (data == "admin_delete_post") return startLinkWorkflow(admin, chat, mid, ConversationStep::DeletePostEnterLink);
    if (data == "admin_reply") return startLinkWorkflow(admin, chat, mid, ConversationStep::ReplyEnterLink);
    if (data == "admin_settings") return showSettingsMenu(chat, mid);
    if (data == "settings_new_type") return startNewType(admin, chat, mid);
    if (data == "settings_manage_types") return showManageTypes(chat, mid);
    if (data == "settings_access") return showAccessSettings(chat, mid);
    if (data == "settings_backup") return backup(chat, mid);
    if (data == "access_edit_admins") return startAccessEdit(admin, chat, mid, ConversationStep::EditAdminIds);
    if (data == "access_edit_forum") return startAccessEdit(admin, chat, mid, ConversationStep::EditForumId);
    if (data == "access_edit_topic") return startAccessEdit(admin, chat, mid, ConversationStep::EditTopicId);

    int64_t id = 0;
    if (parsePrefixedId(data, "select_type:", id)) return selectType(admin, chat, mid, id);
    if (parsePrefixedId(data, "manage_type:", id)) return manageType(admin, chat, mid, id);
    if (parsePrefixedId(data, "toggle_type_active:", id)) return toggleTypeActive(chat, mid, id);
    for (const auto& edit : kTypeEditCallbacks) {
        if (parsePrefixedId(data, edit.prefix, id)) {
            return startTypeEdit(admin, chat, mid, id, edit.step);
        }
    }

    Logger::getInstance().debug("Unknown callback data: " + data);
    return HandleResult::Unhandled;
}

// ---- menus ----

HandleResult ForumAdminHandler::showAdminMenu(int64_t chat_id, int64_t message_id) {
    InlineKeyboard keyboard = {
        {{"➕ Новый пост", "admin_new_post"}},
        {{"✏️ Редактировать пост", "admin_edit_post"}},
        {{"🗑 Удалить пост", "admin_delete_post"}},
        {{"💬 Ответить на сообщение", "admin_reply"}},
        {{"⚙️ Настройки", "admin_settings"}},
    };
    show(chat_id, message_id, "Админ-панель управления постами", keyboard);
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::showSettingsMenu(int64_t chat_id, int64_t message_id) {
    InlineKeyboard keyboard = {
        {{"➕ Новый тип", "settings_new_type"}},
        {{"📋 Типы постов", "settings_manage_types"}},
        {{"🔐 Настройки доступа", "settings_access"}},
        {{"💾 Бэкап", "settings_backup"}},
    };
    show(chat_id, message_id, "Настройки", keyboard);
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::showManageTypes(int64_t chat_id, int64_t message_id) {
    const std::vector<PostType> all = types_.allTypes();
    if (all.empty()) {
        show(chat_id, message_id, "❌ Нет созданных типов постов. Создайте тип в настройках.",
             {{{"← Назад", "admin_settings"}}});
        return HandleResult::Advanced;
    }

    InlineKeyboard keyboard;
    for (const auto& type : all) {
        const std::string label = type.is_active ? type.buttonLabel() : "❌ " + type.buttonLabel();
        keyboard.push_back({{label, "manage_type:" + std::to_string(type.id)}});
    }
    keyboard.push_back({{"← Назад", "admin_settings"}});
    show(chat_id, message_id, "Выберите тип для управления:", keyboard);
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::showAccessSettings(int64_t chat_id, int64_t message_id) {
    const std::vector<int64_t> ids = admins_.admins();
    const ForumTarget target = admins_.forumTarget();

    std::string text = "Настройки доступа:\n\n"
                       "👥 ID администраторов: " + describeIds(ids) + "\n"
                       "💬 ID целевой группы: " + describeId(target.chat_id) + "\n"
                       "📌 ID топика: " + describeId(target.topic_id) + "\n\n"
                       "Выберите настройку для изменения:";
    InlineKeyboard keyboard = {
        {{"👥 ID администраторов", "access_edit_admins"}},
        {{"💬 ID целевой группы", "access_edit_forum"}},
        {{"📌 ID топика", "access_edit_topic"}},
        {{"← Назад", "admin_settings"}},
    };
    show(chat_id, message_id, text, keyboard);
    return HandleResult::Advanced;
}

// ---- new post ----

HandleResult ForumAdminHandler::startNewPost(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    const std::vector<PostType> active = types_.activeTypes();
    if (active.empty()) {
        say(chat_id, "❌ Нет доступных типов постов. Создайте тип в настройках.");
        return HandleResult::Rejected;
    }

    ConversationState state = ConversationState::fresh(admin_id, ConversationStep::NewPostSelectType);
    if (!persist(state, chat_id)) {
        return HandleResult::Failed;
    }

    InlineKeyboard keyboard;
    for (const auto& type : active) {
        keyboard.push_back({{type.buttonLabel(), "select_type:" + std::to_string(type.id)}});
    }
    keyboard.push_back({{"← Назад", "cancel"}});
    rememberPrompt(state, show(chat_id, message_id, "Выберите тип поста:", keyboard));

    Logger::getInstance().info("Admin " + std::to_string(admin_id) + " started a new post");
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::selectType(int64_t admin_id, int64_t chat_id, int64_t message_id, int64_t type_id) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::NewPostSelectType)) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }
    auto type = types_.getType(type_id);
    if (!type || !type->is_active) {
        say(chat_id, kTypeLookupError);
        return HandleResult::Rejected;
    }

    ConversationState next = *state;
    next.selected_type_id = type_id;
    next.last_bot_message_id = 0;
    next.advanceTo(ConversationStep::NewPostEnterText);
    if (!persist(next, chat_id)) {
        return HandleResult::Failed;
    }
    removeMessage(chat_id, message_id);

    const std::string prefix = "Шаблон для типа \"" + type->name + "\":\n\n";
    const std::string text = prefix + type->template_text + "\n\nОтправьте текст поста.";
    rememberPrompt(next, showMaybePhoto(chat_id, type->photo_id, text,
                                        shiftEntities(type->template_entities, utf16Length(prefix)),
                                        cancelKeyboard()));

    Logger::getInstance().info("Type " + std::to_string(type_id) + " selected by admin " + std::to_string(admin_id));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterPostText(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте текст поста");
        return HandleResult::Rejected;
    }
    auto type = types_.getType(state.selected_type_id);
    if (!type) {
        say(msg.chat_id, kTypeLookupError);
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.draft_text = msg.text;
    state.draft_photo_id = type->photo_id;
    state.draft_entities = msg.entities;
    state.advanceTo(ConversationStep::NewPostConfirm);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }

    const std::string prefix = "Предпросмотр поста:\n\n";
    InlineKeyboard keyboard = {
        {{"✅ Подтвердить", "confirm_post"}},
        {{"❌ Отмена", "cancel"}},
    };
    rememberPrompt(state, showMaybePhoto(msg.chat_id, type->photo_id, prefix + msg.text,
                                         shiftEntities(msg.entities, utf16Length(prefix)), keyboard));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::confirmPost(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::NewPostConfirm)) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }
    const ForumTarget target = admins_.forumTarget();
    if (!target.isConfigured()) {
        say(chat_id, kForumNotConfigured);
        return HandleResult::Rejected;
    }

    OutgoingMessage out;
    out.chat_id = target.chat_id;
    out.thread_id = target.topic_id;
    out.text = state->draft_text;
    out.entities = state->draft_entities;
    SendResult published = state->draft_photo_id.empty() ? transport_.sendMessage(out)
                                                         : transport_.sendPhoto(out, state->draft_photo_id);
    if (!published.ok) {
        say(chat_id, "❌ Не удалось опубликовать пост: " + published.error);
        return HandleResult::Failed;
    }

    auto post = posts_.recordPublishedPost(state->selected_type_id, target, published.message_id,
                                           state->draft_text, state->draft_photo_id, state->draft_entities);
    if (!clearState(admin_id)) say(chat_id, kStateSaveError);
    if (!post) {
        say(chat_id, "⚠️ Пост опубликован, но не удалось сохранить запись в БД.\n"
                     "Редактирование и удаление через бота будет недоступно.");
        showAdminMenu(chat_id, 0);
        return HandleResult::Failed;
    }

    removeMessage(chat_id, message_id);
    say(chat_id, "✅ Пост успешно опубликован!");
    showAdminMenu(chat_id, 0);

    Logger::getInstance().info("Post " + std::to_string(post->id) + " published by admin " +
                               std::to_string(admin_id) + " as message " + std::to_string(published.message_id));
    return HandleResult::Committed;
}

// ---- edit / delete ----

HandleResult ForumAdminHandler::startLinkWorkflow(int64_t admin_id, int64_t chat_id, int64_t message_id,
                                                  ConversationStep entry) {
    std::string text;
    switch (entry) {
        case ConversationStep::EditPostEnterLink:
            text = "Отправьте ссылку на пост, который хотите отредактировать.";
            break;
        case ConversationStep::DeletePostEnterLink:
            text = "Отправьте ссылку на пост, который хотите удалить.";
            break;
        case ConversationStep::ReplyEnterLink:
            text = "Отправьте ссылку на сообщение, на которое нужно ответить.";
            break;
        default:
            throw std::logic_error(std::string("not a link workflow: ") + stepName(entry));
    }

    ConversationState state = ConversationState::fresh(admin_id, entry);
    if (!persist(state, chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(chat_id, message_id, text, cancelKeyboard()));

    Logger::getInstance().info("Admin " + std::to_string(admin_id) + " started " +
                               workflowName(workflowOf(entry)));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterEditLink(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте ссылку на пост");
        return HandleResult::Rejected;
    }
    auto post = posts_.findPostByLink(trim(msg.text));
    if (!post) {
        say(msg.chat_id, kBadLinkError);
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.editing_post_id = post->id;
    state.advanceTo(ConversationStep::EditPostEnterText);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }

    const std::string prefix = "Текущий текст поста:\n\n";
    rememberPrompt(state, show(msg.chat_id, 0, prefix + post->text + "\n\nОтправьте новый текст.",
                               cancelKeyboard(), shiftEntities(post->entities, utf16Length(prefix))));

    Logger::getInstance().info("Post " + std::to_string(post->id) + " opened for editing by admin " +
                               std::to_string(msg.from_id));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterEditText(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте новый текст поста");
        return HandleResult::Rejected;
    }
    auto post = posts_.getPost(state.editing_post_id);
    if (!post) {
        say(msg.chat_id, "❌ Ошибка получения поста");
        return HandleResult::Rejected;
    }

    SendResult edited = post->photo_id.empty()
        ? transport_.editMessageText(post->chat_id, post->message_id, msg.text, msg.entities, {})
        : transport_.editMessageCaption(post->chat_id, post->message_id, msg.text, msg.entities);
    if (!edited.ok) {
        say(msg.chat_id, "❌ Не удалось отредактировать пост: " + edited.error);
        return HandleResult::Failed;
    }
    if (!posts_.updatePostText(post->id, msg.text, msg.entities)) {
        say(msg.chat_id, "❌ Ошибка сохранения изменений");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, "✅ Пост успешно отредактирован!");
    showAdminMenu(msg.chat_id, 0);

    Logger::getInstance().info("Post " + std::to_string(post->id) + " edited by admin " + std::to_string(msg.from_id));
    return HandleResult::Committed;
}

HandleResult ForumAdminHandler::enterDeleteLink(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте ссылку на пост");
        return HandleResult::Rejected;
    }
    auto post = posts_.findPostByLink(trim(msg.text));
    if (!post) {
        say(msg.chat_id, kBadLinkError);
        return HandleResult::Rejected;
    }

    SendResult deleted = transport_.deleteMessage(post->chat_id, post->message_id);
    if (!deleted.ok) {
        say(msg.chat_id, "❌ Не удалось удалить пост: " + deleted.error);
        return HandleResult::Failed;
    }
    if (!posts_.deletePost(post->id)) {
        say(msg.chat_id, "❌ Ошибка удаления записи из базы данных");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, "✅ Пост успешно удален!");
    showAdminMenu(msg.chat_id, 0);

    Logger::getInstance().info("Post " + std::to_string(post->id) + " deleted by admin " + std::to_string(msg.from_id));
    return HandleResult::Committed;
}

// ---- post types ----

HandleResult ForumAdminHandler::startNewType(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    ConversationState state = ConversationState::fresh(admin_id, ConversationStep::NewTypeEnterName);
    if (!persist(state, chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(chat_id, message_id, "Введите название нового типа поста.", cancelKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterTypeName(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, введите название типа");
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.temp_name = trim(msg.text);
    state.advanceTo(ConversationStep::NewTypeEnterEmoji);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }

    InlineKeyboard keyboard = {
        {{"⏭ Пропустить", "skip_emoji"}},
        {{"❌ Отмена", "cancel"}},
    };
    rememberPrompt(state, show(msg.chat_id, 0,
                               "Отправьте эмодзи для типа поста (будет отображаться на кнопке) "
                               "или нажмите \"Пропустить\".",
                               keyboard));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterTypeEmoji(const Message& msg, ConversationState state) {
    const std::string emoji = trim(msg.text);
    if (emoji.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте эмодзи или нажмите \"Пропустить\"");
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.temp_emoji = emoji;
    state.advanceTo(ConversationStep::NewTypeEnterImage);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(msg.chat_id, 0, kImagePrompt, imagePromptKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::skipTypeEmoji(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::NewTypeEnterEmoji)) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }

    ConversationState next = *state;
    next.temp_emoji.clear();
    next.last_bot_message_id = 0;
    next.advanceTo(ConversationStep::NewTypeEnterImage);
    if (!persist(next, chat_id)) {
        return HandleResult::Failed;
    }
    removeMessage(chat_id, message_id);
    rememberPrompt(next, show(chat_id, 0, kImagePrompt, imagePromptKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterTypeImage(const Message& msg, ConversationState state) {
    if (!msg.hasPhoto()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте изображение или нажмите \"Пропустить\"");
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.temp_photo_id = msg.photo_id;
    state.advanceTo(ConversationStep::NewTypeEnterTemplate);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(msg.chat_id, 0, "Введите текстовый шаблон для типа поста.", cancelKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::skipTypeImage(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::NewTypeEnterImage)) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }

    ConversationState next = *state;
    next.temp_photo_id.clear();
    next.last_bot_message_id = 0;
    next.advanceTo(ConversationStep::NewTypeEnterTemplate);
    if (!persist(next, chat_id)) {
        return HandleResult::Failed;
    }
    removeMessage(chat_id, message_id);
    rememberPrompt(next, show(chat_id, 0, "Введите текстовый шаблон для типа поста.", cancelKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterTypeTemplate(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, введите текстовый шаблон");
        return HandleResult::Rejected;
    }

    state.temp_template = msg.text;
    auto created = types_.createType(state.temp_name, state.temp_emoji, state.temp_photo_id, state.temp_template,
                                     msg.entities);
    if (!created) {
        say(msg.chat_id, "❌ Ошибка создания типа");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, "✅ Тип поста \"" + created->name + "\" успешно создан!");
    showSettingsMenu(msg.chat_id, 0);
    return HandleResult::Committed;
}

HandleResult ForumAdminHandler::manageType(int64_t admin_id, int64_t chat_id, int64_t message_id, int64_t type_id) {
    auto type = types_.getType(type_id);
    if (!type) {
        say(chat_id, kTypeLookupError);
        return HandleResult::Rejected;
    }

    ConversationState state = ConversationState::fresh(admin_id, ConversationStep::ManageTypes);
    state.editing_type_id = type_id;
    if (!persist(state, chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(chat_id, message_id,
                               "Управление типом \"" + type->name + "\"\n\nВыберите действие:",
                               typeOptionsKeyboard(*type)));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::startTypeEdit(int64_t admin_id, int64_t chat_id, int64_t message_id,
                                              int64_t type_id, ConversationStep step) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::ManageTypes) || state->editing_type_id != type_id) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }
    auto type = types_.getType(type_id);
    if (!type) {
        say(chat_id, kTypeLookupError);
        return HandleResult::Rejected;
    }

    ConversationState next = *state;
    next.last_bot_message_id = 0;
    next.advanceTo(step);
    if (!persist(next, chat_id)) {
        return HandleResult::Failed;
    }

    std::string text;
    std::string entities;
    switch (step) {
        case ConversationStep::EditTypeName:
            text = "Текущее название: \"" + type->name + "\"\n\nВведите новое название.";
            break;
        case ConversationStep::EditTypeEmoji:
            text = "Текущий эмодзи: " + (type->emoji.empty() ? std::string("не задан") : type->emoji) +
                   "\n\nОтправьте новый эмодзи.";
            break;
        case ConversationStep::EditTypeImage:
            text = type->photo_id.empty() ? "Изображение не задано.\n\nОтправьте новое изображение."
                                          : "Отправьте новое изображение для типа \"" + type->name + "\".";
            break;
        default: {
            const std::string prefix = "Текущий шаблон:\n\n";
            text = prefix + type->template_text + "\n\nОтправьте новый шаблон.";
            entities = shiftEntities(type->template_entities, utf16Length(prefix));
            break;
        }
    }
    rememberPrompt(next, show(chat_id, message_id, text, cancelKeyboard(), entities));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterTypeEdit(const Message& msg, ConversationState state) {
    const int64_t type_id = state.editing_type_id;
    const ConversationStep step = *state.step;

    std::string invalid;
    if (step == ConversationStep::EditTypeImage) {
        if (!msg.hasPhoto()) invalid = "❌ Пожалуйста, отправьте изображение";
    } else if (msg.text.empty()) {
        if (step == ConversationStep::EditTypeName) invalid = "❌ Пожалуйста, введите новое название";
        else if (step == ConversationStep::EditTypeEmoji) invalid = "❌ Пожалуйста, отправьте эмодзи";
        else invalid = "❌ Пожалуйста, введите новый шаблон";
    }
    if (!invalid.empty()) {
        say(msg.chat_id, invalid);
        return HandleResult::Rejected;
    }

    bool saved = false;
    std::string done;
    switch (step) {
        case ConversationStep::EditTypeName:
            saved = types_.updateName(type_id, trim(msg.text));
            done = "✅ Название типа обновлено!";
            break;
        case ConversationStep::EditTypeEmoji:
            saved = types_.updateEmoji(type_id, trim(msg.text));
            done = "✅ Эмодзи типа обновлено!";
            break;
        case ConversationStep::EditTypeImage:
            saved = types_.updatePhoto(type_id, msg.photo_id);
            done = "✅ Изображение типа обновлено!";
            break;
        default:
            saved = types_.updateTemplate(type_id, msg.text, msg.entities);
            done = "✅ Шаблон типа обновлен!";
            break;
    }
    if (!saved) {
        say(msg.chat_id, "❌ Ошибка обновления типа поста");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, done);
    showManageTypes(msg.chat_id, 0);

    Logger::getInstance().info(std::string("Post type ") + std::to_string(type_id) + " updated (" +
                               stepName(step) + ") by admin " + std::to_string(msg.from_id));
    return HandleResult::Committed;
}

HandleResult ForumAdminHandler::toggleTypeActive(int64_t chat_id, int64_t message_id, int64_t type_id) {
    auto type = types_.getType(type_id);
    if (!type) {
        say(chat_id, kTypeLookupError);
        return HandleResult::Rejected;
    }
    const bool active = !type->is_active;
    if (!types_.setActive(type_id, active)) {
        say(chat_id, "❌ Ошибка изменения статуса");
        return HandleResult::Failed;
    }

    show(chat_id, message_id,
         "✅ Тип \"" + type->name + "\" " + (active ? "активирован" : "деактивирован") + "!",
         {{{"← Назад", "settings_manage_types"}}});
    Logger::getInstance().info("Post type " + std::to_string(type_id) + (active ? " activated" : " deactivated"));
    return HandleResult::Committed;
}

// ---- access settings ----

HandleResult ForumAdminHandler::startAccessEdit(int64_t admin_id, int64_t chat_id, int64_t message_id,
                                                ConversationStep step) {
    std::string text;
    switch (step) {
        case ConversationStep::EditAdminIds:
            text = "Текущие ID администраторов: " + describeIds(admins_.admins()) +
                   "\n\nОтправьте новый список ID через запятую.";
            break;
        case ConversationStep::EditForumId:
            text = "Текущий ID целевой группы: " + describeId(admins_.forumTarget().chat_id) +
                   "\n\nОтправьте новый ID целевой группы.";
            break;
        case ConversationStep::EditTopicId:
            text = "Текущий ID топика: " + describeId(admins_.forumTarget().topic_id) +
                   "\n\nОтправьте новый ID топика.";
            break;
        default:
            throw std::logic_error(std::string("not an access setting: ") + stepName(step));
    }

    ConversationState state = ConversationState::fresh(admin_id, step);
    if (!persist(state, chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(chat_id, message_id, text, cancelKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterAdminIds(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте список ID");
        return HandleResult::Rejected;
    }

    std::vector<int64_t> parsed;
    try {
        parsed = parseIdList(msg.text);
    } catch (const ConfigError& e) {
        Logger::getInstance().debug(std::string("Rejected admin list: ") + e.what());
        say(msg.chat_id, "❌ Неверный формат ID: " + msg.text);
        return HandleResult::Rejected;
    }

    std::vector<int64_t> ids;
    for (int64_t id : parsed) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(id);
        }
    }
    if (ids.empty()) {
        say(msg.chat_id, "❌ Список ID не может быть пустым");
        return HandleResult::Rejected;
    }
    if (std::find(ids.begin(), ids.end(), msg.from_id) == ids.end()) {
        say(msg.chat_id, "❌ Список должен содержать ваш ID (" + std::to_string(msg.from_id) +
                         "), иначе вы потеряете доступ к боту");
        return HandleResult::Rejected;
    }

    if (!admins_.setAdmins(ids)) {
        say(msg.chat_id, "❌ Ошибка сохранения конфигурации");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, "✅ ID администраторов обновлены!");
    showAccessSettings(msg.chat_id, 0);

    Logger::getInstance().info("Admin list set to [" + describeIds(ids) + "] by " + std::to_string(msg.from_id));
    return HandleResult::Committed;
}

HandleResult ForumAdminHandler::enterForumOrTopicId(const Message& msg, ConversationState state) {
    const bool forum = state.at(ConversationStep::EditForumId);
    if (msg.text.empty()) {
        say(msg.chat_id, forum ? "❌ Пожалуйста, отправьте ID целевой группы" : "❌ Пожалуйста, отправьте ID топика");
        return HandleResult::Rejected;
    }
    int64_t value = 0;
    if (!parseInt(msg.text, value)) {
        say(msg.chat_id, "❌ Неверный формат ID");
        return HandleResult::Rejected;
    }

    const bool saved = forum ? admins_.setForumChat(value) : admins_.setTopic(value);
    if (!saved) {
        say(msg.chat_id, "❌ Ошибка сохранения конфигурации");
        return HandleResult::Failed;
    }

    dropLastPrompt(state, msg.chat_id);
    if (!clearState(msg.from_id)) say(msg.chat_id, kStateSaveError);
    say(msg.chat_id, forum ? "✅ ID целевой группы обновлен!" : "✅ ID топика обновлен!");
    showAccessSettings(msg.chat_id, 0);

    Logger::getInstance().info(std::string(forum ? "Forum chat" : "Topic") + " set to " + std::to_string(value) +
                               " by admin " + std::to_string(msg.from_id));
    return HandleResult::Committed;
}

// ---- reply ----

HandleResult ForumAdminHandler::enterReplyLink(const Message& msg, ConversationState state) {
    if (msg.text.empty()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте ссылку на сообщение");
        return HandleResult::Rejected;
    }
    auto link = PostManager::parsePostLink(trim(msg.text));
    if (!link) {
        say(msg.chat_id, "❌ Неверный формат ссылки");
        return HandleResult::Rejected;
    }
    const int64_t target_chat = link->chat_id != 0 ? link->chat_id : admins_.forumTarget().chat_id;
    if (target_chat == 0) {
        say(msg.chat_id, kForumNotConfigured);
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.reply_target_chat_id = target_chat;
    state.reply_target_message_id = link->message_id;
    state.advanceTo(ConversationStep::ReplyEnterText);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }
    rememberPrompt(state, show(msg.chat_id, 0, "Отправьте текст ответа.", cancelKeyboard()));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::enterReplyText(const Message& msg, ConversationState state) {
    if (msg.body().empty() && !msg.hasPhoto()) {
        say(msg.chat_id, "❌ Пожалуйста, отправьте текст ответа");
        return HandleResult::Rejected;
    }

    dropLastPrompt(state, msg.chat_id);
    state.draft_text = msg.body();
    state.draft_photo_id = msg.photo_id;
    state.draft_entities = msg.entities;
    state.advanceTo(ConversationStep::ReplyConfirm);
    if (!persist(state, msg.chat_id)) {
        return HandleResult::Failed;
    }

    const std::string prefix = "Предпросмотр ответа:\n\n";
    InlineKeyboard keyboard = {
        {{"✅ Отправить", "confirm_reply"}},
        {{"❌ Отмена", "cancel"}},
    };
    rememberPrompt(state, showMaybePhoto(msg.chat_id, state.draft_photo_id, prefix + state.draft_text,
                                         shiftEntities(state.draft_entities, utf16Length(prefix)), keyboard));
    return HandleResult::Advanced;
}

HandleResult ForumAdminHandler::confirmReply(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    auto state = loadState(admin_id);
    if (!state || !state->at(ConversationStep::ReplyConfirm)) {
        say(chat_id, kWrongStepError);
        return HandleResult::Rejected;
    }

    OutgoingMessage out;
    out.chat_id = state->reply_target_chat_id;
    out.reply_to_message_id = state->reply_target_message_id;
    out.text = state->draft_text;
    out.entities = state->draft_entities;
    SendResult sent = state->draft_photo_id.empty() ? transport_.sendMessage(out)
                                                    : transport_.sendPhoto(out, state->draft_photo_id);
    if (!sent.ok) {
        say(chat_id, "❌ Не удалось отправить ответ: " + sent.error);
        return HandleResult::Failed;
    }

    auto reply = posts_.recordReply(out.chat_id, out.reply_to_message_id, sent.message_id, state->draft_text,
                                    state->draft_photo_id, state->draft_entities);
    if (!clearState(admin_id)) say(chat_id, kStateSaveError);
    if (!reply) {
        say(chat_id, "⚠️ Ответ отправлен, но не удалось сохранить запись в БД.");
        showAdminMenu(chat_id, 0);
        return HandleResult::Failed;
    }

    removeMessage(chat_id, message_id);
    say(chat_id, "✅ Ответ отправлен!");
    showAdminMenu(chat_id, 0);

    Logger::getInstance().info("Reply " + std::to_string(reply->id) + " sent by admin " + std::to_string(admin_id) +
                               " to message " + std::to_string(out.reply_to_message_id));
    return HandleResult::Committed;
}

// ---- cancel / backup ----

HandleResult ForumAdminHandler::cancel(int64_t admin_id, int64_t chat_id, int64_t message_id) {
    if (!clearState(admin_id)) {
        say(chat_id, kStateSaveError);
        return HandleResult::Failed;
    }
    removeMessage(chat_id, message_id);
    showAdminMenu(chat_id, 0);
    Logger::getInstance().info("Admin " + std::to_string(admin_id) + " cancelled");
    return HandleResult::Cancelled;
}

HandleResult ForumAdminHandler::backup(int64_t chat_id, int64_t message_id) {
    SendResult loading = show(chat_id, message_id, "⏳ Создание бэкапа...", {});
    const int64_t loading_id = loading.ok ? (loading.message_id != 0 ? loading.message_id : message_id) : 0;

    try {
        backups_.sendBackup(chat_id);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Backup failed: ") + e.what());
        const std::string text = std::string("❌ Ошибка при создании бэкапа: ") + e.what();
        if (loading_id != 0) {
            show(chat_id, loading_id, text, {});
        } else {
            say(chat_id, text);
        }
        return HandleResult::Failed;
    }

    removeMessage(chat_id, loading_id);
    return HandleResult::Committed;
}

// ---- helpers ----

std::optional<ConversationState> ForumAdminHandler::loadState(int64_t admin_id) {
    return states_.get(admin_id);
}

bool ForumAdminHandler::persist(const ConversationState& state, int64_t chat_id) {
    try {
        states_.save(state);
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error("Failed to save state for admin " + std::to_string(state.admin_id) + ": " +
                                    e.what());
        say(chat_id, kStateSaveError);
        return false;
    }
    Logger::getInstance().debug("Admin " + std::to_string(state.admin_id) + " -> " +
                                (state.step ? stepName(*state.step) : "idle"));
    return true;
}

bool ForumAdminHandler::clearState(int64_t admin_id) {
    try {
        states_.clear(admin_id);
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error("Failed to clear state for admin " + std::to_string(admin_id) + ": " + e.what());
        return false;
    }
    return true;
}

void ForumAdminHandler::rememberPrompt(ConversationState& state, const SendResult& sent) {
    if (!sent.ok || sent.message_id == 0) {
        return;
    }
    state.last_bot_message_id = sent.message_id;
    if (!state.step) {
        return;
    }
    try {
        if (!states_.recordPrompt(state.admin_id, *state.step, sent.message_id)) {
            Logger::getInstance().debug("Prompt " + std::to_string(sent.message_id) + " for admin " +
                                        std::to_string(state.admin_id) + " not recorded: state moved on");
        }
    } catch (const std::runtime_error& e) {
        Logger::getInstance().warning("Could not record prompt " + std::to_string(sent.message_id) +
                                      " for admin " + std::to_string(state.admin_id) + ": " + e.what());
    }
}

void ForumAdminHandler::dropLastPrompt(ConversationState& state, int64_t chat_id) {
    removeMessage(chat_id, state.last_bot_message_id);
    state.last_bot_message_id = 0;
}

SendResult ForumAdminHandler::say(int64_t chat_id, const std::string& text) {
    OutgoingMessage out;
    out.chat_id = chat_id;
    out.text = text;
    return transport_.sendMessage(out);
}

SendResult ForumAdminHandler::show(int64_t chat_id, int64_t message_id, const std::string& text,
                                   const InlineKeyboard& keyboard, const std::string& entities) {
    if (message_id > 0) {
        SendResult edited = transport_.editMessageText(chat_id, message_id, text, entities, keyboard);
        if (edited.ok && edited.message_id == 0) {
            edited.message_id = message_id;
        }
        return edited;
    }
    OutgoingMessage out;
    out.chat_id = chat_id;
    out.text = text;
    out.entities = entities;
    out.keyboard = keyboard;
    return transport_.sendMessage(out);
}

SendResult ForumAdminHandler::showMaybePhoto(int64_t chat_id, const std::string& photo_id, const std::string& text,
                                             const std::string& entities, const InlineKeyboard& keyboard) {
    OutgoingMessage out;
    out.chat_id = chat_id;
    out.text = text;
    out.entities = entities;
    out.keyboard = keyboard;
    return photo_id.empty() ? transport_.sendMessage(out) : transport_.sendPhoto(out, photo_id);
}

void ForumAdminHandler::removeMessage(int64_t chat_id, int64_t message_id) {
    if (message_id <= 0) {
        return;
    }
    SendResult removed = transport_.deleteMessage(chat_id, message_id);
    if (!removed.ok) {
        Logger::getInstance().debug("Message " + std::to_string(message_id) + " not deleted: " + removed.error);
    }
}

} // namespace forumbot
