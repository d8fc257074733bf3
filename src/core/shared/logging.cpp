#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(mmCore, "mailmind.core")
Q_LOGGING_CATEGORY(mmPool, "mailmind.pool")
Q_LOGGING_CATEGORY(mmBatch, "mailmind.batch")
Q_LOGGING_CATEGORY(mmLearning, "mailmind.learning")
Q_LOGGING_CATEGORY(mmStore, "mailmind.store")
Q_LOGGING_CATEGORY(mmBackend, "mailmind.backend")
