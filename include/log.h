/*
 * @file log.h
 * @brief C style logging utility shared by the engine, the trainer and the CLI
 */

#ifndef CLF_LOG_H
#define CLF_LOG_H

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <string.h>
#include <time.h>
#include <errno.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#define CLFLOG_MSG_BUF_SIZE   1024    // user message max
#define CLFLOG_META_BUF_SIZE   128    // "[LEVEL] [time] - " header
#define CLFLOG_LINE_BUF_SIZE (CLFLOG_META_BUF_SIZE + CLFLOG_MSG_BUF_SIZE)
#define CLFLOG_RESOURCE_PATH "./output"

// inline: one queue and one writer for the whole program, whichever unit logs

inline pthread_mutex_t clf_log_mutex = PTHREAD_MUTEX_INITIALIZER;
inline int clf_log_thread_running = 1;
inline pthread_t clf_log_thread_id;

typedef struct clf_log_node {
    char* message;
    struct clf_log_node* next;
} clf_log_node_t;

inline clf_log_node_t* clf_log_head = NULL;
inline clf_log_node_t* clf_log_tail = NULL;
inline pthread_cond_t clf_log_cv = PTHREAD_COND_INITIALIZER;

inline void clf_time_string(char* buffer, size_t size) {
    time_t now = time(NULL);
    struct tm tm_info;
    localtime_r(&now, &tm_info);
    strftime(buffer, size, "%Y-%m-%d %H:%M:%S", &tm_info);
}

inline void clf_ensure_directory_exists(const char* dirPath) {
    struct stat st;
    memset(&st, 0, sizeof(st));
    if (stat(dirPath, &st) == -1) {
        if (mkdir(dirPath, 0700) != 0) {
            fprintf(stderr, "[LOGGER] Directory create failed: %s\n", dirPath);
        }
    }
}

inline void* clf_log_thread_func(void*) {
    pthread_mutex_lock(&clf_log_mutex);
    for (;;) {
        while (clf_log_head == NULL && clf_log_thread_running)
            pthread_cond_wait(&clf_log_cv, &clf_log_mutex);

        // drain what is queued even when asked to stop
        while (clf_log_head) {
            clf_log_node_t* node = clf_log_head;
            clf_log_head = node->next;
            if (!clf_log_head) clf_log_tail = NULL;
            pthread_mutex_unlock(&clf_log_mutex);

            // one file per level: ./output/INFO.log, ./output/ERROR.log ...
            char level[16] = {0};
            const char* level_start = strchr(node->message, '[');
            const char* level_end = level_start ? strchr(level_start + 1, ']') : NULL;
            if (level_start && level_end && (size_t)(level_end - level_start - 1) < sizeof(level)) {
                strncpy(level, level_start + 1, (size_t)(level_end - level_start - 1));
            } else {
                strncpy(level, "UNKNOWN", sizeof(level) - 1);
            }

            char filepath[256];
            clf_ensure_directory_exists(CLFLOG_RESOURCE_PATH);
            snprintf(filepath, sizeof(filepath), "%s/%s.log", CLFLOG_RESOURCE_PATH, level);

            FILE* fp = fopen(filepath, "a");
            if (fp) {
                fputs(node->message, fp);
                fclose(fp);
            }

            free(node->message);
            free(node);
            pthread_mutex_lock(&clf_log_mutex);
        }
        if (!clf_log_thread_running) break;
    }
    pthread_mutex_unlock(&clf_log_mutex);
    return NULL;
}

inline void start_log_thread() {
    pthread_mutex_lock(&clf_log_mutex);
    clf_log_thread_running = 1;
    pthread_mutex_unlock(&clf_log_mutex);
    pthread_create(&clf_log_thread_id, NULL, clf_log_thread_func, NULL);
}

inline void stop_log_thread() {
    pthread_mutex_lock(&clf_log_mutex);
    clf_log_thread_running = 0;
    pthread_cond_broadcast(&clf_log_cv);
    pthread_mutex_unlock(&clf_log_mutex);
    pthread_join(clf_log_thread_id, NULL);
}

inline void CLF_COUT_(const char* level, const char* func, int line, const char* format, ...)
    __attribute__((format(printf, 4, 5)));

inline void CLF_COUT_(const char* level, const char* func, int line, const char* format, ...) {
    char buf[CLFLOG_MSG_BUF_SIZE];
    va_list args;
    va_start(args, format);
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

#ifdef _DEBUG
    if (strcmp(level, "ERROR") == 0 || strcmp(level, "FATAL") == 0) {
        int err = errno;
        if (err > 0) {
            strncat(buf, " | errno=", sizeof(buf) - strlen(buf) - 1);
            strncat(buf, strerror(err), sizeof(buf) - strlen(buf) - 1);
        }
    }
#endif

    char time_buf[20];
    clf_time_string(time_buf, sizeof(time_buf));

    char meta[CLFLOG_META_BUF_SIZE];
#ifdef _DEBUG
    snprintf(meta, sizeof(meta), "[%s] [%s] (%s:%d) - ", level, time_buf, func, line);
#else
    (void)func;
    (void)line;
    snprintf(meta, sizeof(meta), "[%s] [%s] - ", level, time_buf);
#endif

    char* log_line = (char*)malloc(CLFLOG_LINE_BUF_SIZE);
    if (!log_line) return;
    snprintf(log_line, CLFLOG_LINE_BUF_SIZE, "%.127s%.1022s\n", meta, buf);

    printf("%s", log_line);
    fflush(stdout);

#ifdef _DEBUG
    clf_log_node_t* node = (clf_log_node_t*)malloc(sizeof(clf_log_node_t));
    if (node) {
        pthread_mutex_lock(&clf_log_mutex);
        node->message = log_line;
        node->next = NULL;
        if (clf_log_tail) clf_log_tail->next = node;
        else clf_log_head = node;
        clf_log_tail = node;
        pthread_cond_signal(&clf_log_cv);
        pthread_mutex_unlock(&clf_log_mutex);
        log_line = NULL;
    }
#endif
    free(log_line);

    if (strcmp(level, "FATAL") == 0)
        exit(EXIT_FAILURE);
}

#define CLFLOG_I(format, ...) CLF_COUT_("INFO",  __func__, __LINE__, format, ##__VA_ARGS__)
#define CLFLOG_E(format, ...) CLF_COUT_("ERROR", __func__, __LINE__, format, ##__VA_ARGS__)
#define CLFLOG_F(format, ...) CLF_COUT_("FATAL", __func__, __LINE__, format, ##__VA_ARGS__)
#define CLFLOG_D(format, ...) CLF_COUT_("DEBUG", __func__, __LINE__, format, ##__VA_ARGS__)
#define CLFLOG_W(format, ...) CLF_COUT_("WARN",  __func__, __LINE__, format, ##__VA_ARGS__)

#endif // CLF_LOG_H
