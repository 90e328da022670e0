#pragma once

// Common path
#define ROOT									"/opt/face_attendance/"
#define ASSETS									ROOT "assets/"


// Detector / recognizer models
#define YNMODEL_PATH							ASSETS "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"

#define SFACE_RECOGNIZER_PATH					ASSETS "models/face/"
#define SFACE_RECOGNIZER						"face_recognizer_fast.onnx"


// Sqlite DB
#define DB_PATH                            		ASSETS "db/"
#define DB                                  	"attendance.db"
